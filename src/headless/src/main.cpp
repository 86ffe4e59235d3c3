#include "cg_config.h"
#include "cg_log.h"
#include "cg_session.h"

#include <iostream>
#include <sstream>
#include <string>

namespace
{
  static void printCommands()
  {
    std::cout
      << "Commands:\n"
      << "  move <di> <dj>              Step the player by whole cells.\n"
      << "  goto <i> <j>                Put the player at the center of a cell.\n"
      << "  view <s> <n> <w> <e>        Report continuous viewport bounds.\n"
      << "  region <i0> <i1> <j0> <j1>  Set the visible cell rectangle directly.\n"
      << "  pickup <i> <j>              Pick up the cache in a cell.\n"
      << "  place <i> <j>               Merge the carried token into a cell.\n"
      << "  craft <value>               Combine two carried tokens of a value.\n"
      << "  cell <i> <j>                Show the resolved content of a cell.\n"
      << "  inv | status | grid | overlay | help | quit\n";
  }

  static void printDelta(const cg::ViewportDelta& d, const cg::GameSession& s)
  {
    std::cout << "viewport +" << d.entered.size() << " -" << d.left.size()
              << " live=" << s.materializer().materializedCount() << "\n";
  }

  static void printInventory(const cg::GameSession& s)
  {
    std::cout << "inventory:";
    if (s.inventoryTokens().empty())
      std::cout << " (empty)";
    for (cg::TokenValue v : s.inventoryTokens())
      std::cout << " " << v;
    std::cout << "\n";
  }

  static void printCell(const cg::CellView& v)
  {
    std::cout << "cell " << v.cell.i << "," << v.cell.j << ": ";
    if (v.hasCache)
      std::cout << "cache " << *v.value;
    else
      std::cout << "empty";
    std::cout << (v.interactable ? " [interactable]" : "") << "\n";
  }

  // North at the top, one character per visible cell.
  static void printGrid(const cg::GameSession& s)
  {
    const cg::CellRect r = s.materializer().visibleRegion();
    if (r.empty())
    {
      std::cout << "(nothing visible)\n";
      return;
    }

    const cg::CellCoord p = s.playerCell();
    for (int64_t i = r.maxI; i >= r.minI; --i)
    {
      std::string row;
      for (int64_t j = r.minJ; j <= r.maxJ; ++j)
      {
        const cg::CellCoord c{ static_cast<int32_t>(i), static_cast<int32_t>(j) };
        if (c == p)
        {
          row.push_back('@');
          continue;
        }
        const cg::CellView v = s.cellView(c);
        if (!v.hasCache)
          row.push_back('.');
        else
          row.push_back(*v.value < 10 ? static_cast<char>('0' + *v.value) : '+');
      }
      std::cout << row << "\n";
    }
  }

  static void printResult(const cg::InteractionResult& r)
  {
    std::cout << cg::interactionStatusName(r.status) << ": " << r.describe() << "\n";
  }

  static bool readCell(std::istringstream& in, cg::CellCoord& out)
  {
    return static_cast<bool>(in >> out.i >> out.j);
  }
}

int main(int argc, char** argv)
{
  cg::LaunchOptions options{};
  cg::applyEnvironmentOverrides(options);
  if (!cg::parseLaunchArgs(argc, argv, options))
  {
    cg::printLaunchUsage(argv[0]);
    return 2;
  }
  if (options.showHelp)
  {
    cg::printLaunchUsage(argv[0]);
    printCommands();
    return 0;
  }
  cg::setLogLevel(options.logLevel);

  cg::GameSession session(options.session);

  std::string line;
  while (std::getline(std::cin, line))
  {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd) || cmd[0] == '#')
      continue;

    cg::CellCoord cell{};
    if (cmd == "quit" || cmd == "exit")
    {
      break;
    }
    else if (cmd == "help")
    {
      printCommands();
    }
    else if (cmd == "move")
    {
      int32_t di = 0, dj = 0;
      if (in >> di >> dj)
        printDelta(session.stepPlayer(di, dj), session);
      else
        std::cout << "usage: move <di> <dj>\n";
    }
    else if (cmd == "goto")
    {
      if (readCell(in, cell))
        printDelta(session.reportPlayerMoved(session.mapping().cellCenter(cell)), session);
      else
        std::cout << "usage: goto <i> <j>\n";
    }
    else if (cmd == "view")
    {
      cg::ContinuousBounds b{};
      if (in >> b.south >> b.north >> b.west >> b.east)
        printDelta(session.reportViewportBounds(b), session);
      else
        std::cout << "usage: view <s> <n> <w> <e>\n";
    }
    else if (cmd == "region")
    {
      cg::CellRect r{};
      if (in >> r.minI >> r.maxI >> r.minJ >> r.maxJ)
        printDelta(session.setVisibleRegion(r), session);
      else
        std::cout << "usage: region <i0> <i1> <j0> <j1>\n";
    }
    else if (cmd == "pickup")
    {
      if (readCell(in, cell))
        printResult(session.requestPickup(cell));
      else
        std::cout << "usage: pickup <i> <j>\n";
    }
    else if (cmd == "place")
    {
      if (readCell(in, cell))
        printResult(session.requestPlace(cell));
      else
        std::cout << "usage: place <i> <j>\n";
    }
    else if (cmd == "craft")
    {
      cg::TokenValue v = 0;
      if (in >> v)
        printResult(session.requestCraft(v));
      else
        std::cout << "usage: craft <value>\n";
    }
    else if (cmd == "cell")
    {
      if (readCell(in, cell))
        printCell(session.cellView(cell));
      else
        std::cout << "usage: cell <i> <j>\n";
    }
    else if (cmd == "inv")
    {
      printInventory(session);
    }
    else if (cmd == "status")
    {
      const cg::CellCoord p = session.playerCell();
      std::cout << "player " << p.i << "," << p.j
                << " won=" << (session.wonSnapshot() ? "yes" : "no")
                << " overlay=" << session.overlay().size()
                << " live=" << session.materializer().materializedCount() << "\n";
      printInventory(session);
    }
    else if (cmd == "grid")
    {
      printGrid(session);
    }
    else if (cmd == "overlay")
    {
      for (const auto& [c, value] : session.overlay().sortedEntries())
      {
        std::cout << c.i << "," << c.j << " ";
        if (value.isToken())
          std::cout << "token " << value.value << "\n";
        else
          std::cout << "empty\n";
      }
    }
    else
    {
      std::cout << "unknown command: " << cmd << " (try help)\n";
    }
  }

  return 0;
}
