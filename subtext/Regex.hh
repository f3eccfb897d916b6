#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "subtext/Types.hh"

namespace subtext {

// Inspired by https://github.com/luvit/pcre2/blob/master/src/pcre2demo.c
class Match;

class Regex {
 public:
  explicit Regex(const std::string& pattern,  // pattern to be compiled
                 uint32_t options = 0  // pcre2 options for regex compilation
  );
  ~Regex();

  Regex(const Regex&) = delete;
  Regex& operator=(const Regex&) = delete;

  // Searches subj from start, leftmost match first. Returns the pcre2 result
  // code: > 0 on a match, PCRE2_ERROR_NOMATCH when there is none, other
  // negative values on errors.
  int find(std::string_view subj,  // the string (view) against we are matching
           Match* M,               // where to store the results of the match
           size_t start = 0,       // where to start searching in the string
           uint32_t options = 0    // search options
  ) const;

  const pcre2_code* get_pcre2_code() const;  // return compiled regex
  const std::string& pattern() const { return pattern_; }
  std::string get_error_message() const;  // return error message

  // Human readable text for a pcre2 error code.
  static std::string describe(int error_code);
  // return true if pattern compiled successfully, false otherwise
  bool ok() const;

  // Number of capturing groups in the pattern, excluding group 0.
  uint32_t capture_count() const;

 private:
  std::string pattern_;

  PCRE2_SIZE error_offset_;
  int error_number_;
  pcre2_code* const re_;
};

class Match {
 public:
  pcre2_match_data* const match_data;  // stores matching offsets
  const char* data{nullptr};           // beginning of subject text span
  int num_matched_groups{0};

  explicit Match(const pcre2_code* re);
  explicit Match(const Regex& re);
  ~Match();

  Match(const Match&) = delete;
  Match& operator=(const Match&) = delete;

  std::string_view operator[](int i) const;

  // Offsets of group i relative to the subject, or nullopt when the group did
  // not take part in the match.
  std::optional<Range> range(int i) const;
};

}  // namespace subtext
