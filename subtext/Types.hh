#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace subtext {

/// Range stores indices for half-interval [begin, end) in a string. Used to
/// represent the bounds of a matched span.
struct Range {
  size_t begin;
  size_t end;
  size_t size() const { return end - begin; }
};

inline bool operator==(const Range &a, const Range &b) {
  return a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const Range &a, const Range &b) { return !(a == b); }

template <class T>
using Ptr = std::shared_ptr<T>;

/// The string a Span was matched against. Shared and read-only, so that every
/// Span derived from a match refers to the same instance.
using Text = Ptr<const std::string>;

inline Text make_text(std::string text) {
  return std::make_shared<const std::string>(std::move(text));
}

}  // namespace subtext
