#include "subtext/Pattern.hh"

#include <stdexcept>
#include <utility>

#include "subtext/Macros.hh"

namespace subtext {

namespace {

std::optional<Span> occurrence(const Text &text, size_t index,
                               size_t length) {
  if (index == std::string::npos) {
    return std::nullopt;
  }
  return Span(text, Range{index, index + length});
}

Ptr<const Regex> compile(const std::string &expression) {
  auto compiled = std::make_shared<const Regex>(expression);
  if (!compiled->ok()) {
    throw std::invalid_argument(compiled->get_error_message());
  }
  return compiled;
}

}  // namespace

Pattern::Pattern(Matcher matcher)
    : matcher_(std::make_shared<const Matcher>(std::move(matcher))) {}

std::optional<Span> Pattern::match(const Text &text) const {
  if (text == nullptr) {
    throw std::invalid_argument("Pattern matched against a null string");
  }
  return (*matcher_)(text);
}

std::optional<Span> Pattern::match(std::string text) const {
  return match(make_text(std::move(text)));
}

std::string Pattern::remove_from(std::string input) const {
  Text text = make_text(std::move(input));
  std::optional<Span> span = match(text);
  return span ? span->remove() : *text;
}

std::string Pattern::replace_from(std::string input, char replacement) const {
  return replace_from(std::move(input), std::string_view(&replacement, 1));
}

std::string Pattern::replace_from(std::string input,
                                  std::string_view replacement) const {
  Text text = make_text(std::move(input));
  std::optional<Span> span = match(text);
  return span ? span->replace_with(replacement) : *text;
}

Pattern Pattern::or_else(Pattern other) const {
  Pattern self = *this;
  return Pattern([self, other](const Text &text) {
    std::optional<Span> span = self.match(text);
    return span ? span : other.match(text);
  });
}

template <class Transform>
Pattern Pattern::then(Transform transform) const {
  Pattern self = *this;
  return Pattern([self, transform](const Text &text) -> std::optional<Span> {
    std::optional<Span> span = self.match(text);
    if (!span) {
      return std::nullopt;
    }
    return transform(*span);
  });
}

Pattern Pattern::before() const {
  return then([](const Span &span) { return span.left(); });
}

Pattern Pattern::after() const {
  return then([](const Span &span) { return span.right(); });
}

Pattern Pattern::and_before() const {
  return then([](const Span &span) { return span.extend_left(); });
}

Pattern Pattern::and_after() const {
  return then([](const Span &span) { return span.extend_right(); });
}

const Pattern &none() {
  static const Pattern kNone(
      [](const Text & /*text*/) -> std::optional<Span> { return std::nullopt; });
  return kNone;
}

const Pattern &all() {
  static const Pattern kAll([](const Text &text) -> std::optional<Span> {
    return Span(text, Range{0, text->size()});
  });
  return kAll;
}

Pattern prefix(std::string text) {
  return Pattern([text](const Text &input) -> std::optional<Span> {
    if (input->compare(0, text.size(), text) != 0) {
      return std::nullopt;
    }
    return Span(input, Range{0, text.size()});
  });
}

Pattern prefix(char c) {
  return Pattern([c](const Text &input) -> std::optional<Span> {
    if (input->empty() || input->front() != c) {
      return std::nullopt;
    }
    return Span(input, Range{0, 1});
  });
}

Pattern suffix(std::string text) {
  return Pattern([text](const Text &input) -> std::optional<Span> {
    size_t size = input->size();
    if (size < text.size() ||
        input->compare(size - text.size(), text.size(), text) != 0) {
      return std::nullopt;
    }
    return Span(input, Range{size - text.size(), size});
  });
}

Pattern suffix(char c) {
  return Pattern([c](const Text &input) -> std::optional<Span> {
    if (input->empty() || input->back() != c) {
      return std::nullopt;
    }
    return Span(input, Range{input->size() - 1, input->size()});
  });
}

Pattern first(std::string snippet) {
  return Pattern([snippet](const Text &input) {
    return occurrence(input, input->find(snippet), snippet.size());
  });
}

Pattern first(char c) {
  return Pattern(
      [c](const Text &input) { return occurrence(input, input->find(c), 1); });
}

Pattern last(std::string snippet) {
  return Pattern([snippet](const Text &input) {
    return occurrence(input, input->rfind(snippet), snippet.size());
  });
}

Pattern last(char c) {
  return Pattern(
      [c](const Text &input) { return occurrence(input, input->rfind(c), 1); });
}

Pattern regex(const std::string &expression) {
  return regex_group(expression, 0);
}

Pattern regex(Ptr<const Regex> compiled) {
  return regex_group(std::move(compiled), 0);
}

Pattern regex_group(const std::string &expression, int group) {
  return regex_group(compile(expression), group);
}

Pattern regex_group(Ptr<const Regex> compiled, int group) {
  if (group < 0) {
    throw std::invalid_argument("group cannot be negative: " +
                                std::to_string(group));
  }
  if (compiled == nullptr || !compiled->ok()) {
    throw std::invalid_argument("regex_group requires a compiled expression");
  }

  return Pattern([compiled, group](const Text &input) -> std::optional<Span> {
    // Match data is per call, the compiled expression is shared.
    Match match(*compiled);
    int rc = compiled->find(*input, &match);
    if (rc == PCRE2_ERROR_NOMATCH) {
      return std::nullopt;
    }
    if (rc < 0) {
      throw std::runtime_error("Matching /" + compiled->pattern() +
                               "/ failed: " + Regex::describe(rc));
    }

    if (static_cast<uint32_t>(group) > compiled->capture_count()) {
      throw std::out_of_range("No group " + std::to_string(group) + " in /" +
                              compiled->pattern() + "/");
    }
    std::optional<Range> range = match.range(group);
    if (!range) {
      throw std::out_of_range("Group " + std::to_string(group) + " of /" +
                              compiled->pattern() +
                              "/ is not set by this match");
    }
    // \K inside a lookaround can move the start past the end.
    if (range->begin > range->end) {
      throw std::runtime_error("Group " + std::to_string(group) + " of /" +
                               compiled->pattern() + "/ starts at " +
                               std::to_string(range->begin) +
                               " after its end " +
                               std::to_string(range->end));
    }
    LOG(debug, "/%s/ group %d matched [%zu, %zu)", compiled->pattern().c_str(),
        group, range->begin, range->end);
    return Span(input, *range);
  });
}

}  // namespace subtext
