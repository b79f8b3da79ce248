#include "tsdb/format.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tsdb {

namespace {

bool needs_quotes(const std::string &s) {
  if (s.empty())
    return false;
  if (s.front() == ' ' || s.front() == '\t')
    return true;
  return s.find_first_of("\t\"\r\n") != std::string::npos;
}

} // namespace

std::string format_float(double v) {
  if (std::isnan(v))
    return "NaN";
  if (std::isinf(v))
    return v > 0 ? "+Inf" : "-Inf";

  std::string sign = std::signbit(v) ? "-" : "";
  double a = std::fabs(v);
  if (a == 0.0)
    return sign + "0";

  // подбираем минимальное число значащих цифр, при котором значение
  // восстанавливается без потерь
  char buf[64];
  for (int prec = 1; prec <= 17; ++prec) {
    std::snprintf(buf, sizeof(buf), "%.*e", prec - 1, a);
    if (std::strtod(buf, nullptr) == a)
      break;
  }

  // buf: d.ddddde±XX
  std::string s(buf);
  auto epos = s.find('e');
  int exp10 = std::atoi(s.c_str() + epos + 1);
  std::string digits;
  for (std::size_t i = 0; i < epos; ++i) {
    if (s[i] != '.')
      digits += s[i];
  }
  while (digits.size() > 1 && digits.back() == '0')
    digits.pop_back();

  std::string out;
  if (exp10 >= 0) {
    const auto int_len = static_cast<std::size_t>(exp10) + 1;
    if (digits.size() <= int_len) {
      out = digits + std::string(int_len - digits.size(), '0');
    } else {
      out = digits.substr(0, int_len) + "." + digits.substr(int_len);
    }
  } else {
    out = "0." + std::string(static_cast<std::size_t>(-exp10 - 1), '0') +
          digits;
  }
  return sign + out;
}

std::string format_tags(const Tags &tags) {
  std::string out;
  for (const auto &[k, v] : tags) {
    if (!out.empty())
      out += ',';
    out += k;
    out += '=';
    out += v;
  }
  return out;
}

std::string encode_row(const std::vector<std::string> &columns) {
  std::string out;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0)
      out += '\t';
    const auto &col = columns[i];
    if (!needs_quotes(col)) {
      out += col;
      continue;
    }
    out += '"';
    for (char c : col) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
  }
  out += '\n';
  return out;
}

std::vector<std::string> decode_row(const std::string &line) {
  std::vector<std::string> cols;
  std::string cur;
  bool quoted = false;
  bool in_quotes = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        cur += c;
      }
      continue;
    }
    if (c == '"' && cur.empty() && !quoted) {
      quoted = true;
      in_quotes = true;
    } else if (c == '\t') {
      cols.push_back(std::move(cur));
      cur.clear();
      quoted = false;
    } else {
      cur += c;
    }
  }
  cols.push_back(std::move(cur));
  return cols;
}

} // namespace tsdb
