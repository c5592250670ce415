#include "json_table/grid_table.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  // widths must not depend on the environment's locale
  setenv("LC_ALL", "C", 1);
  setenv("LANG", "C", 1);

  {
    const std::string got = jt::render_grid_table({{"a", "b"}, {"1", "22"}}, true);
    const std::string want =
        "+---+----+\n"
        "| a | b  |\n"
        "+===+====+\n"
        "| 1 | 22 |\n"
        "+---+----+\n";
    check(got == want, "header separated by '='");
    if (got != want) std::cerr << got;
  }
  {
    const std::string got = jt::render_grid_table({{"x", "y"}, {"1", "2"}}, false);
    check(got.find('=') == std::string::npos, "no '=' rule without header");
  }
  {
    // ragged rows are padded to the widest row
    const std::string got = jt::render_grid_table({{"h1", "h2"}, {"1", "", "3"}, {"solo"}}, true);
    const std::string want =
        "+------+----+---+\n"
        "| h1   | h2 |   |\n"
        "+======+====+===+\n"
        "| 1    |    | 3 |\n"
        "+------+----+---+\n"
        "| solo |    |   |\n"
        "+------+----+---+\n";
    check(got == want, "ragged rows padded");
    if (got != want) std::cerr << got;
  }
  {
    const std::string got = jt::render_grid_table({{"a\tb\nc"}}, false);
    check(got.find("| a b c |") != std::string::npos, "tabs and newlines become spaces");
  }
  {
    const std::string got = jt::render_grid_table({}, true);
    const std::string want =
        "+-------------------+\n"
        "| No data available |\n"
        "+-------------------+\n";
    check(got == want, "empty matrix placeholder");
  }
  check(jt::display_width("abc") == 3 && jt::display_width("") == 0, "ascii display width");
  check(jt::display_width("東京") == 4, "CJK cells take two columns each");
  check(jt::display_width("Zürich") == 6, "accented letters take one column");
  check(jt::display_width("e\xCC\x81") == 1, "combining mark takes no column");
  check(jt::display_width("a\xFF" "b") == 3, "invalid byte counts as one column");
  {
    const std::string got = jt::render_grid_table({{"名前", "city"}, {"東京", "Zürich"}, {"ab", "cd"}}, true);
    const std::string want =
        "+------+--------+\n"
        "| 名前 | city   |\n"
        "+======+========+\n"
        "| 東京 | Zürich |\n"
        "+------+--------+\n"
        "| ab   | cd     |\n"
        "+------+--------+\n";
    check(got == want, "non-ascii cells aligned");
    if (got != want) std::cerr << got;
  }
  {
    const std::string got = jt::render_grid_table({{"名前"}, {"ab"}}, false);
    const std::string want =
        "+------+\n"
        "| 名前 |\n"
        "+------+\n"
        "| ab   |\n"
        "+------+\n";
    check(got == want, "wide header pads narrow rows");
    if (got != want) std::cerr << got;
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s)\n"; return 1; }
  std::cout << "[PASS] grid table\n";
  return 0;
}
