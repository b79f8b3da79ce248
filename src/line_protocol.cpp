#include "tsdb/line_protocol.hpp"
#include "tsdb/errors.hpp"
#include "tsdb/format.hpp"
#include "tsdb/time_utils.hpp"
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <map>

namespace tsdb {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))
    s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split_ws(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i]))
      ++i;
    std::size_t start = i;
    while (i < s.size() && !is_space(s[i]))
      ++i;
    if (i > start)
      out.push_back(s.substr(start, i - start));
  }
  return out;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string syntax_error(std::string_view text) {
  return "parsing \"" + std::string(text) + "\": invalid syntax";
}

std::string range_error(std::string_view text) {
  return "parsing \"" + std::string(text) + "\": value out of range";
}

// Возвращает пустую строку при успехе, иначе текст ошибки.
bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  return true;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Десятичная запись: [+-]digits[.digits][e[+-]digits], а также inf/infinity/nan.
bool is_decimal_float(std::string_view s) {
  if (!s.empty() && (s.front() == '+' || s.front() == '-'))
    s.remove_prefix(1);
  if (iequals(s, "inf") || iequals(s, "infinity") || iequals(s, "nan"))
    return true;

  std::size_t i = 0, mantissa = 0;
  while (i < s.size() && is_digit(s[i]))
    ++i, ++mantissa;
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && is_digit(s[i]))
      ++i, ++mantissa;
  }
  if (mantissa == 0)
    return false;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
      ++i;
    std::size_t exp = 0;
    while (i < s.size() && is_digit(s[i]))
      ++i, ++exp;
    if (exp == 0)
      return false;
  }
  return i == s.size();
}

std::string parse_double(std::string_view text, double &out) {
  const std::string s(text);
  if (!is_decimal_float(text))
    return syntax_error(text);
  char *end = nullptr;
  errno = 0;
  out = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size())
    return syntax_error(text);
  if (errno == ERANGE && std::abs(out) > 1.0)
    return range_error(text);
  return {};
}

std::string parse_int64(std::string_view text, std::int64_t &out) {
  std::string_view digits = text;
  if (!digits.empty() && digits.front() == '+')
    digits.remove_prefix(1);
  if (digits.empty() || digits.front() == '+' ||
      (digits.front() == '-' && digits.size() != text.size()))
    return syntax_error(text);

  auto res = std::from_chars(digits.data(), digits.data() + digits.size(), out);
  if (res.ec == std::errc::result_out_of_range)
    return range_error(text);
  if (res.ec != std::errc() || res.ptr != digits.data() + digits.size())
    return syntax_error(text);
  return {};
}

AppError line_error(std::string msg, std::size_t line_no) {
  auto err = validation_error(std::move(msg));
  err.with_context("line", line_no);
  return err;
}

Point parse_line(std::string_view line, std::size_t line_no) {
  auto parts = split_ws(line);
  if (parts.size() != 3) {
    throw line_error("invalid line format: expected 3 parts, got " +
                         std::to_string(parts.size()),
                     line_no);
  }

  Point p;

  auto head = split(parts[0], ',');
  if (head[0].empty())
    throw line_error("missing measurement name", line_no);
  p.measurement = std::string(head[0]);

  for (std::size_t i = 1; i < head.size(); ++i) {
    const auto pair = head[i];
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos)
      throw line_error("malformed tag: " + std::string(pair), line_no);
    const auto key = pair.substr(0, eq);
    const auto value = pair.substr(eq + 1);
    if (key.empty() || value.empty())
      throw line_error("invalid tag key or value: " + std::string(pair),
                       line_no);
    p.tags[std::string(key)] = std::string(value);
  }

  for (const auto pair : split(parts[1], ',')) {
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos)
      throw line_error("malformed field: " + std::string(pair), line_no);
    const auto key = pair.substr(0, eq);
    if (key.empty())
      throw line_error("empty field name", line_no);

    const auto raw = pair.substr(eq + 1);
    auto number = raw;
    if (!number.empty() && number.back() == 'i')
      number.remove_suffix(1); // целочисленный суффикс

    double value = 0;
    auto err = parse_double(number, value);
    if (!err.empty()) {
      throw line_error("invalid field value '" + std::string(raw) +
                           "': " + err,
                       line_no);
    }
    p.fields[std::string(key)] = value;
  }

  std::int64_t ns = 0;
  auto err = parse_int64(parts[2], ns);
  if (!err.empty())
    throw line_error("invalid timestamp: " + err, line_no);
  p.timestamp = from_unix_nanos(ns);

  return p;
}

} // namespace

std::vector<Point> parse_line_protocol(std::string_view input) {
  std::vector<Point> points;
  std::size_t line_no = 0;
  for (const auto line : split(input, '\n')) {
    ++line_no;
    if (trim(line).empty())
      continue;
    points.push_back(parse_line(line, line_no));
  }
  return points;
}

std::string to_line_protocol(const Point &p) {
  std::string out = p.measurement;

  std::map<std::string, std::string> tags(p.tags.begin(), p.tags.end());
  for (const auto &[k, v] : tags)
    out += "," + k + "=" + v;

  std::map<std::string, double> fields(p.fields.begin(), p.fields.end());
  bool first = true;
  for (const auto &[k, v] : fields) {
    out += first ? " " : ",";
    first = false;
    out += k + "=" + format_float(v);
  }

  out += " " + std::to_string(to_unix_nanos(p.timestamp));
  return out;
}

} // namespace tsdb
