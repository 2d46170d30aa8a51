#include "flyg/core/key_case.hpp"

#include <cctype>

namespace flyg::core {

std::string SnakeToLowerCamel(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  bool upper_next = false;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char ch = name[i];
    if (ch == '_' && !result.empty() && i + 1 < name.size()) {
      upper_next = true;
      continue;
    }
    if (upper_next) {
      result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
      upper_next = false;
    } else {
      result.push_back(ch);
    }
  }
  return result;
}

std::string LowerCamelToSnake(std::string_view key) {
  std::string result;
  result.reserve(key.size() + 4);
  for (const char ch : key) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isupper(uch)) {
      if (!result.empty()) {
        result.push_back('_');
      }
      result.push_back(static_cast<char>(std::tolower(uch)));
    } else {
      result.push_back(ch);
    }
  }
  return result;
}

}  // namespace flyg::core
