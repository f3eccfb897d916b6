#include "subtext/Regex.hh"

#include <cassert>
#include <sstream>

#include "subtext/Macros.hh"

namespace subtext {

Regex::Regex(const std::string& pattern, uint32_t options)
    : pattern_(pattern),
      error_offset_(0),
      error_number_(0),
      re_(pcre2_compile(PCRE2_SPTR(pattern.c_str()), /* the pattern */
                        pattern.size(),              /* pattern length */
                        options,                     /* options */
                        &error_number_,              /* for error number */
                        &error_offset_,              /* for error offset */
                        nullptr))                    /* default context */
{
  if (re_ == nullptr) {
    LOG(error, "%s", get_error_message().c_str());
    return;
  }

  uint32_t have_jit = 0;
  pcre2_config(PCRE2_CONFIG_JIT, &have_jit);
  if (have_jit) {
    pcre2_jit_compile(re_, PCRE2_JIT_COMPLETE);
  }
  LOG(info, "Compiled /%s/ (jit=%u)", pattern_.c_str(), have_jit);
}

std::string Regex::describe(int error_code) {
  PCRE2_UCHAR buffer[256];
  pcre2_get_error_message(error_code, buffer, sizeof(buffer));
  return std::string(reinterpret_cast<const char*>(buffer));
}

std::string Regex::get_error_message() const {
  std::ostringstream msg;
  msg << "PCRE2 compilation of /" << pattern_ << "/ failed at offset "
      << error_offset_ << ": " << describe(error_number_);
  return msg.str();
}

// return compiled regex
const pcre2_code* Regex::get_pcre2_code() const { return re_; }

uint32_t Regex::capture_count() const {
  uint32_t count = 0;
  pcre2_pattern_info(re_, PCRE2_INFO_CAPTURECOUNT, &count);
  return count;
}

int Regex::find(
    std::string_view subj,  // the string (view) against we are matching
    Match* M,               // where to store the results of the match
    size_t start,           // where to start searching in the string
    uint32_t options        // search options
) const {
  assert(start <= subj.size());
  int rc = pcre2_match(re_,                     /* the compiled pattern */
                       PCRE2_SPTR(subj.data()), /* the subject string */
                       subj.size(),             /* the length of the subject */
                       start,                   /* where to start */
                       options,                 /* options */
                       M->match_data, /* block for storing the result */
                       nullptr);      /* use default match context */
  M->data = rc > 0 ? subj.data() : nullptr;
  M->num_matched_groups = rc;
  return rc;  // returns the number of matched groups
}

bool Regex::ok() const { return re_ != nullptr; }

Regex::~Regex() { pcre2_code_free(re_); }

Match::Match(const Regex& re) : Match(re.get_pcre2_code()) {}

Match::Match(const pcre2_code* re)
    : match_data(pcre2_match_data_create_from_pattern(re, nullptr)) {
  SUBTEXT_ABORT_IF(match_data == nullptr, "Failed to allocate match data");
}

Match::~Match() { pcre2_match_data_free(match_data); }

std::string_view Match::operator[](int i) const {
  std::optional<Range> group = range(i);
  if (!group) {
    return std::string_view();
  }
  return std::string_view(data + group->begin, group->size());
}

std::optional<Range> Match::range(int i) const {
  // Groups at or beyond the return code of pcre2_match were not set.
  if (i < 0 || i >= num_matched_groups) {
    return std::nullopt;
  }
  PCRE2_SIZE* o = pcre2_get_ovector_pointer(match_data);
  i <<= 1;
  if (o[i] == PCRE2_UNSET) {
    return std::nullopt;
  }
  return Range{o[i], o[i + 1]};
}

}  // namespace subtext
