#pragma once
#include <cstddef>
#include <functional>
#include <istream>
#include <sstream>
#include <string>

namespace subtext {

template <class Printable>
std::string fmt(const Printable &printable) {
  std::stringstream stream;
  stream << printable;
  return stream.str();
}

// This combinator is based on boost::hash_combine, but uses
// std::hash as the hash implementation. Used as a drop-in
// replacement for boost::hash_combine.
template <class T, class HashType = std::size_t>
inline void hash_combine(HashType &seed, const T &v) {
  std::hash<T> hasher;
  // Constants only appear here, and are taken from some StackOverflow (or
  // marian).
  seed ^= (                             //
      static_cast<HashType>(hasher(v))  //
      + 0x9e3779b9                      // NOLINT
      + (seed << 6) + (seed >> 2)       // NOLINT
  );
}

// Calls fun on each line of in as soon as it is read, until the stream is
// exhausted. A trailing line without a newline is passed on; an empty stream
// produces no calls. Returns the number of lines seen.
size_t for_each_line(std::istream &in,
                     const std::function<void(std::string &)> &fun);

}  // namespace subtext
