#include "subtext/Span.hh"

#include <utility>

#include "subtext/Macros.hh"
#include "subtext/Utils.hh"

namespace subtext {

Span::Span(Text text, Range range) : text_(std::move(text)), range_(range) {
  SUBTEXT_ABORT_IF(text_ == nullptr, "Span constructed without a string");
  SUBTEXT_ABORT_IF(
      range_.begin > range_.end || range_.end > text_->size(),
      "Span out of bounds: [" + std::to_string(range_.begin) + ", " +
          std::to_string(range_.end) + ") in a string of size " +
          std::to_string(text_->size()));
}

std::string_view Span::text_before() const {
  return std::string_view(*text_).substr(0, range_.begin);
}

std::string_view Span::text_after() const {
  return std::string_view(*text_).substr(range_.end);
}

std::string_view Span::view() const {
  return std::string_view(*text_).substr(range_.begin, range_.size());
}

std::string Span::remove() const {
  if (range_.end == text_->size()) {
    return std::string(text_before());
  }
  if (range_.begin == 0) {
    return std::string(text_after());
  }
  std::string_view before = text_before();
  std::string_view after = text_after();
  std::string removed;
  removed.reserve(before.size() + after.size());
  removed.append(before.data(), before.size());
  removed.append(after.data(), after.size());
  return removed;
}

std::string Span::replace_with(char replacement) const {
  return replace_with(std::string_view(&replacement, 1));
}

std::string Span::replace_with(std::string_view replacement) const {
  std::string_view before = text_before();
  std::string_view after = text_after();
  std::string replaced;
  replaced.reserve(before.size() + replacement.size() + after.size());
  replaced.append(before.data(), before.size());
  replaced.append(replacement.data(), replacement.size());
  replaced.append(after.data(), after.size());
  return replaced;
}

Span Span::left() const { return Span(text_, Range{0, range_.begin}); }

Span Span::right() const {
  return Span(text_, Range{range_.end, text_->size()});
}

Span Span::extend_left() const { return Span(text_, Range{0, range_.end}); }

Span Span::extend_right() const {
  return Span(text_, Range{range_.begin, text_->size()});
}

bool operator==(const Span &lhs, const Span &rhs) {
  if (lhs.range() != rhs.range()) {
    return false;
  }
  // Same instance is the common case for spans derived from one match.
  return lhs.text() == rhs.text() || *lhs.text() == *rhs.text();
}

bool operator!=(const Span &lhs, const Span &rhs) { return !(lhs == rhs); }

std::ostream &operator<<(std::ostream &out, const Span &span) {
  std::string_view matched = span.view();
  out.write(matched.data(), matched.size());
  return out;
}

}  // namespace subtext

namespace std {

size_t hash<subtext::Span>::operator()(const subtext::Span &span) const {
  size_t seed = 0;
  subtext::hash_combine(seed, *span.text());
  subtext::hash_combine(seed, span.range().begin);
  subtext::hash_combine(seed, span.range().end);
  return seed;
}

}  // namespace std
