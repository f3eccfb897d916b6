#pragma once
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "subtext/Types.hh"

namespace subtext {

/// Span is one matched region [index(), index() + length()) inside the string
/// it was matched against. The Span shares ownership of that string, and every
/// Span derived from it (left(), right(), extend_left(), extend_right())
/// refers to the very same instance, never a copy.
///
/// A Span is immutable. Operations that "edit" the string (remove(),
/// replace_with()) return a new std::string and leave the owning string
/// untouched.
///
/// Example: for the string "foobarbaz" and a Span over "bar",
///
///   text_before() = "foo"
///   view()        = "bar"
///   text_after()  = "baz"
///   remove()      = "foobaz"
class Span {
 public:
  /// Bounds are checked against text; offsets outside of it abort.
  Span(Text text, Range range);

  /// Part of the owning string up to index().
  std::string_view text_before() const;

  /// Part of the owning string from the end of the span onwards.
  std::string_view text_after() const;

  /// Returns the owning string with this span excised.
  std::string remove() const;

  /// Returns the owning string with this span substituted by replacement. The
  /// replacement is inserted as is.
  std::string replace_with(char replacement) const;
  std::string replace_with(std::string_view replacement) const;

  size_t index() const { return range_.begin; }
  size_t length() const { return range_.size(); }

  std::string_view view() const;
  std::string str() const { return std::string(view()); }

  const Range &range() const { return range_; }
  const Text &text() const { return text_; }

  // Derived spans over the same owning string.
  Span left() const;          // [0, begin)
  Span right() const;         // [end, size)
  Span extend_left() const;   // [0, end)
  Span extend_right() const;  // [begin, size)

 private:
  Text text_;
  Range range_;
};

/// Two spans are equal if they cover the same offsets of equal strings.
bool operator==(const Span &lhs, const Span &rhs);
bool operator!=(const Span &lhs, const Span &rhs);

std::ostream &operator<<(std::ostream &out, const Span &span);

}  // namespace subtext

namespace std {
template <>
struct hash<subtext::Span> {
  size_t operator()(const subtext::Span &span) const;
};
}  // namespace std
