#include "remedy/verifier.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <vector>

#include "remedy/jsonlite.hpp"

namespace remedy {

namespace {

// Labels only. The number after a label is scanned by hand so that the regex
// engine never runs over an arbitrarily long digit string.
const std::vector<std::regex>& answer_labels() {
  static const std::vector<std::regex> labels = [] {
    const char* texts[] = {
        "(?:optimal |best |final )?objective:",
        "(?:optimal |best |final )?cost:",
        "(?:minimum |min )?cost:",
        "(?:maximum |max )?profit:",
        "(?:total |sum )?profit:",
        "(?:optimal |best )?solution:",
        "(?:optimal |best )?value:",
        "answer:",
    };
    std::vector<std::regex> out;
    for (const char* text : texts) {
      out.emplace_back(text, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    }
    return out;
  }();
  return labels;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Length of a number of the form [-+]?\d*\.?\d+([eE][-+]?\d+)? at `pos`, or 0.
std::size_t scan_number(const std::string& s, std::size_t pos) {
  std::size_t i = pos;
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
  const std::size_t int_begin = i;
  while (i < s.size() && is_digit(s[i])) ++i;
  bool digits = i > int_begin;
  if (i + 1 < s.size() && s[i] == '.' && is_digit(s[i + 1])) {
    ++i;
    while (i < s.size() && is_digit(s[i])) ++i;
    digits = true;
  }
  if (!digits) return 0;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    std::size_t j = i + 1;
    if (j < s.size() && (s[j] == '-' || s[j] == '+')) ++j;
    if (j < s.size() && is_digit(s[j])) {
      while (j < s.size() && is_digit(s[j])) ++j;
      i = j;
    }
  }
  return i - pos;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::optional<double> parse_double(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(v)) {
    return std::nullopt;
  }
  return v;
}

}  // namespace

std::optional<double> extract_answer(const std::string& stdout_text) {
  for (const auto& label : answer_labels()) {
    auto begin = stdout_text.cbegin();
    std::smatch m;
    while (std::regex_search(begin, stdout_text.cend(), m, label)) {
      std::size_t pos = static_cast<std::size_t>(m[0].second - stdout_text.cbegin());
      while (pos < stdout_text.size() && std::isspace(static_cast<unsigned char>(stdout_text[pos]))) ++pos;
      const std::size_t len = scan_number(stdout_text, pos);
      if (len > 0) return parse_double(stdout_text.substr(pos, len));
      begin = m[0].first + 1;
    }
  }
  return std::nullopt;
}

std::optional<double> parse_expected(const std::string& expected) {
  return parse_double(trim(expected));
}

VerificationOutcome verify(const std::string& stdout_text, const std::string& expected,
                           double tolerance) {
  VerificationOutcome out;
  out.expected_value = parse_expected(expected);
  out.predicted_value = extract_answer(stdout_text);

  if (!out.expected_value) {
    out.status_message = "ground truth is not numeric: '" + trim(expected) + "'";
    return out;
  }
  if (!out.predicted_value) {
    out.is_correct = false;
    out.status_message = "cannot extract answer from output";
    return out;
  }

  const double error = std::fabs(*out.predicted_value - *out.expected_value);
  out.is_correct = error <= tolerance + kToleranceSlack;
  out.status_message = std::string(*out.is_correct ? "correct" : "incorrect") +
                       " (predicted=" + jsonlite::format_double(*out.predicted_value) +
                       ", expected=" + jsonlite::format_double(*out.expected_value) +
                       ", error=" + jsonlite::format_double(error) + ")";
  return out;
}

}  // namespace remedy
