#include <sstream>
#include <string>
#include <vector>

#include "TestSuite.hh"
#include "subtext/Utils.hh"

namespace subtext {

void for_each_line_in_stream() {
  // No trailing newline on the last line, and an empty line in between.
  std::istringstream stream("foo // x\n\nbar");
  std::vector<std::string> lines;
  size_t count = for_each_line(stream, [&lines](std::string &line) {
    lines.push_back(first("//").and_after().remove_from(line));
  });
  SUBTEXT_CHECK_EQUAL(count, 3u);
  SUBTEXT_CHECK_EQUAL(lines.size(), 3u);
  SUBTEXT_CHECK_EQUAL(lines[0], "foo ");
  SUBTEXT_CHECK_EQUAL(lines[1], "");
  SUBTEXT_CHECK_EQUAL(lines[2], "bar");

  std::istringstream empty("");
  size_t calls = 0;
  SUBTEXT_CHECK_EQUAL(
      for_each_line(empty, [&calls](std::string &) { ++calls; }), 0u);
  SUBTEXT_CHECK_EQUAL(calls, 0u);
}

void for_each_line_is_incremental() {
  // Each line is handed over before the next one is read.
  std::istringstream stream("a\nb\n");
  std::vector<std::streampos> positions;
  for_each_line(stream, [&stream, &positions](std::string &) {
    positions.push_back(stream.tellg());
  });
  SUBTEXT_CHECK_EQUAL(positions.size(), 2u);
  SUBTEXT_CHECK(positions[0] == std::streampos(2));
}

}  // namespace subtext
