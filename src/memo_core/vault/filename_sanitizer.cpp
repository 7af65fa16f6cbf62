#include "memo_core/vault/filename_sanitizer.hpp"

#include <utf8.h>

#include <cstring>
#include <iterator>

namespace memo_core {

namespace {

std::string trim(const std::string& s) {
  const char* whitespace = " \t\r\n\v\f";
  const auto begin = s.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string sanitize_filename(const std::string& text) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::string stripped;
  stripped.reserve(valid.size());
  for (char c : valid) {
    if (c != '\0' && std::strchr(INVALID_FILENAME_CHARS, c) == nullptr) {
      stripped.push_back(c);
    }
  }

  std::string result = trim(stripped);
  if (result.empty()) {
    return FILENAME_PLACEHOLDER;
  }

  auto it = result.begin();
  std::size_t chars = 0;
  while (it != result.end() && chars < MAX_FILENAME_CHARS) {
    utf8::next(it, result.end());
    chars++;
  }
  result.erase(it, result.end());
  return result;
}

}  // namespace memo_core
