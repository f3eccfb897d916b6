#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "CLI/CLI.hpp"
#include "subtext/Macros.hh"
#include "subtext/Utils.hh"
#include "subtext/subtext.hh"

// A string option that may legitimately be empty, so presence is tracked
// through the CLI11 option rather than the value.
struct Given {
  std::string value;
  CLI::Option *option = nullptr;

  explicit operator bool() const {
    return option != nullptr && option->count() > 0;
  }
};

struct Literals {
  Given prefix;
  Given suffix;
  Given first;
  Given last;
  Given regex;

  template <class App>
  void setup_onto(App &app, const std::string &tag, const std::string &what) {
    // clang-format off
    prefix.option = app.add_option("--" + tag + "prefix", prefix.value, what + " matching a literal prefix");
    suffix.option = app.add_option("--" + tag + "suffix", suffix.value, what + " matching a literal suffix");
    first.option = app.add_option("--" + tag + "first", first.value, what + " matching the first occurrence of a snippet");
    last.option = app.add_option("--" + tag + "last", last.value, what + " matching the last occurrence of a snippet");
    regex.option = app.add_option("--" + tag + "regex", regex.value, what + " matching the first find of a regular expression");
    // clang-format on
  }

  size_t count() const {
    return static_cast<size_t>(static_cast<bool>(prefix)) +
           static_cast<bool>(suffix) + static_cast<bool>(first) +
           static_cast<bool>(last) + static_cast<bool>(regex);
  }

  std::optional<subtext::Pattern> build(int group) const {
    if (prefix) return subtext::prefix(prefix.value);
    if (suffix) return subtext::suffix(suffix.value);
    if (first) return subtext::first(first.value);
    if (last) return subtext::last(last.value);
    if (regex) return subtext::regex_group(regex.value, group);
    return std::nullopt;
  }
};

struct Options {
  Literals primary;
  Literals fallback;
  int group = 0;
  CLI::Option *group_option = nullptr;

  bool before = false;
  bool after = false;
  bool and_before = false;
  bool and_after = false;

  Given replace;
  bool matched_only = false;
  bool version = false;

  template <class App>
  void setup_onto(App &app) {
    primary.setup_onto(app, "", "Pattern");
    fallback.setup_onto(app, "or-", "Fallback pattern");
    // clang-format off
    group_option = app.add_option("--group", group, "Capture group of --regex to cover (not of --or-regex)");
    app.add_flag("--before", before, "Cover the part before the match");
    app.add_flag("--after", after, "Cover the part after the match");
    app.add_flag("--and-before", and_before, "Extend the match to the beginning of the line");
    app.add_flag("--and-after", and_after, "Extend the match to the end of the line");
    replace.option = app.add_option("--replace", replace.value, "Replace the match by this text instead of removing it");
    app.add_flag("--matched-only", matched_only, "Print only the matched text, skip lines without a match");
    app.add_flag("--version", version, "Display version");
    // clang-format on
  }

  subtext::Pattern build() const {
    if (primary.count() != 1 || fallback.count() > 1) {
      throw std::invalid_argument(
          "Exactly one of --prefix, --suffix, --first, --last, --regex and at "
          "most one --or-* option is required");
    }
    if (group_option != nullptr && group_option->count() > 0 &&
        !primary.regex) {
      throw std::invalid_argument("--group requires --regex");
    }
    size_t projections = static_cast<size_t>(before) + after + and_before +
                         and_after;
    if (projections > 1) {
      throw std::invalid_argument(
          "--before, --after, --and-before and --and-after are exclusive");
    }

    subtext::Pattern pattern = *primary.build(group);
    if (std::optional<subtext::Pattern> other = fallback.build(0)) {
      pattern = pattern | *other;
    }

    if (before) return pattern.before();
    if (after) return pattern.after();
    if (and_before) return pattern.and_before();
    if (and_after) return pattern.and_after();
    return pattern;
  }
};

void run(const Options &options) {
  using namespace subtext;  // NOLINT
  Pattern pattern = options.build();

  size_t count = for_each_line(std::cin, [&](std::string &line) {
    if (options.matched_only) {
      std::optional<Span> span = pattern.match(std::move(line));
      if (span) {
        std::cout << *span << std::endl;
      }
    } else if (options.replace) {
      std::cout << pattern.replace_from(std::move(line), options.replace.value)
                << std::endl;
    } else {
      std::cout << pattern.remove_from(std::move(line)) << std::endl;
    }
  });
  LOG(info, "Processed %zu lines", count);
}

int main(int argc, char *argv[]) {
  CLI::App app{"subtext: remove, replace or extract one span per line"};
  Options options;
  options.setup_onto(app);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  if (options.version) {
    fprintf(stdout, "subtext %s\n", SUBTEXT_VERSION);
    std::exit(EXIT_SUCCESS);
  }

  try {
    run(options);
  } catch (const std::exception &e) {
    std::cerr << "subtext: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
