#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "subtext/Regex.hh"
#include "subtext/Span.hh"
#include "subtext/Types.hh"

namespace subtext {

/// A Pattern locates at most one Span in a given string. Patterns are cheap to
/// copy, immutable, and keep no state between calls, so the same Pattern can
/// be applied to different strings from different threads.
///
/// New patterns are built by the factories below or from existing ones through
/// the combinators, e.g. to strip either "http://" or "https://":
///
///   Pattern scheme = prefix("http://").or_else(prefix("https://"));
///   std::string host = scheme.remove_from(uri);
///
/// and to drop a trailing comment:
///
///   std::string code = first("//").and_after().remove_from(line);
class Pattern {
 public:
  using Matcher = std::function<std::optional<Span>(const Text &)>;

  explicit Pattern(Matcher matcher);

  /// Finds the span in text, or nullopt if there is none. A null text is a
  /// contract violation and throws std::invalid_argument.
  std::optional<Span> match(const Text &text) const;
  std::optional<Span> match(std::string text) const;

  /// Returns input with the matched span removed, or input as is when there
  /// is no match.
  std::string remove_from(std::string input) const;

  /// Returns input with the matched span replaced by replacement, or input as
  /// is when there is no match.
  std::string replace_from(std::string input, char replacement) const;
  std::string replace_from(std::string input,
                           std::string_view replacement) const;

  /// Falls back to other, applied to the same input, if this fails to match.
  /// other is not consulted when this matches.
  Pattern or_else(Pattern other) const;

  /// Matches with this, then covers the part before the match.
  Pattern before() const;

  /// Matches with this, then covers the part after the match.
  Pattern after() const;

  /// Matches with this, then extends the match to the beginning of the string.
  Pattern and_before() const;

  /// Matches with this, then extends the match to the end of the string.
  Pattern and_after() const;

 private:
  // Matches with this and maps a successful match through transform.
  template <class Transform>
  Pattern then(Transform transform) const;

  Ptr<const Matcher> matcher_;
};

inline Pattern operator|(const Pattern &lhs, const Pattern &rhs) {
  return lhs.or_else(rhs);
}

/// Never matches.
const Pattern &none();

/// Matches the entire string, including the empty string.
const Pattern &all();

/// Matches strings starting with text.
Pattern prefix(std::string text);
Pattern prefix(char c);

/// Matches strings ending with text.
Pattern suffix(std::string text);
Pattern suffix(char c);

/// Matches the leftmost occurrence of snippet.
Pattern first(std::string snippet);
Pattern first(char c);

/// Matches the rightmost occurrence of snippet.
Pattern last(std::string snippet);
Pattern last(char c);

/// Matches the first occurrence of the regular expression, found by scanning
/// left to right. A replacement applied through replace_from() is literal:
/// `$1` or `\1` are not expanded.
///
/// The textual form compiles the expression once; an expression that does
/// not compile throws std::invalid_argument.
Pattern regex(const std::string &expression);
Pattern regex(Ptr<const Regex> compiled);

/// Like regex(), but covers capturing group `group` of the first match. A
/// negative group throws std::invalid_argument immediately. Matching throws
/// std::out_of_range when the expression matches but does not define `group`
/// for that match.
Pattern regex_group(const std::string &expression, int group);
Pattern regex_group(Ptr<const Regex> compiled, int group);

}  // namespace subtext
