#include "string_util.h"

#include <cctype>

namespace munsell::util {

namespace {

bool is_delimiter(char c) {
  return c == ' ' || c == '/';
}

}  // namespace

std::string to_upper(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::vector<std::string> split_spec(std::string_view s) {
  std::vector<std::string> tokens;
  size_t pos = 0;
  while (pos <= s.size()) {
    size_t end = pos;
    while (end < s.size() && !is_delimiter(s[end])) {
      ++end;
    }
    tokens.emplace_back(s.substr(pos, end - pos));
    if (end == s.size()) break;
    while (end < s.size() && is_delimiter(s[end])) {
      ++end;
    }
    pos = end;
  }
  // "5R 4/" and "" produce trailing empties; only a leading one is meaningful.
  while (!tokens.empty() && tokens.back().empty()) {
    tokens.pop_back();
  }
  return tokens;
}

}  // namespace munsell::util
