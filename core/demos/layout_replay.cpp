// Layout replay - feeds JSON commands (one object per line) through a
// LayoutSession and prints each result followed by the final layout.
//
//   layout_replay [commands.jsonl]      (reads stdin without an argument)
//
// Blank lines and lines starting with '#' are skipped.

#include "dl/commands/LayoutCommandProcessor.hpp"
#include "dl/layout/BoundsCalculator.hpp"
#include "dl/session/LayoutSession.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

static void printBounds(const dl::LayoutSession& session) {
  dl::PanelBounds bounds = session.bounds();
  for (const auto& p : session.tree().allPanels()) {
    const dl::Rect& r = bounds.at(p.id);
    const dl::Tab* active = p.activeTab();
    std::printf("  panel %llu  [%.1f, %.1f, %.1f x %.1f]  tabs=%zu  active=%s\n",
                static_cast<unsigned long long>(p.id), r.x, r.y, r.width, r.height,
                p.tabCount(), active ? active->title.c_str() : "-");
  }
}

int main(int argc, char** argv) {
  std::ifstream file;
  if (argc > 1) {
    file.open(argv[1]);
    if (!file) {
      std::fprintf(stderr, "layout_replay: cannot open %s\n", argv[1]);
      return 1;
    }
  }
  std::istream& in = argc > 1 ? static_cast<std::istream&>(file) : std::cin;

  dl::LayoutSession session;
  dl::LayoutCommandProcessor cp(session);

  std::string line;
  int lineNo = 0;
  int failures = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (line.empty() || line[0] == '#') continue;

    dl::CmdResult r = cp.applyJsonText(line);
    if (r.ok) {
      std::printf("%4d ok   id=%llu changed=%d\n", lineNo,
                  static_cast<unsigned long long>(r.createdId), r.changed ? 1 : 0);
    } else {
      ++failures;
      std::printf("%4d FAIL %s: %s %s\n", lineNo, r.err.code.c_str(),
                  r.err.message.c_str(), r.err.details.c_str());
    }
  }

  std::printf("\nFinal layout (%zu panels, %zu tabs):\n",
              session.tree().panelCount(), session.tree().tabCount());
  printBounds(session);
  std::printf("%s\n", cp.layoutJson().c_str());

  return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
