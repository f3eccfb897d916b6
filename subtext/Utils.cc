#include "subtext/Utils.hh"

#include <string>

namespace subtext {

size_t for_each_line(std::istream &in,
                     const std::function<void(std::string &)> &fun) {
  size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    fun(line);
    ++count;
  }
  return count;
}

}  // namespace subtext
