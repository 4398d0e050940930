#include "env.hpp"

#include <cstdlib>

namespace eventship::util {

std::string ExpandEnvironmentStrings(std::string_view value) {
  std::string out;
  out.reserve(value.size());

  std::size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '%') {
      out.push_back(value[i++]);
      continue;
    }

    const auto close = value.find('%', i + 1);
    if (close == std::string_view::npos) {
      out.append(value.substr(i));
      break;
    }
    if (close == i + 1) {
      out.push_back('%');
      i = close + 1;
      continue;
    }

    const std::string name(value.substr(i + 1, close - i - 1));
    if (const char* env = std::getenv(name.c_str())) {
      out += env;
    } else {
      out.append(value.substr(i, close - i + 1));
    }
    i = close + 1;
  }
  return out;
}

} // namespace eventship::util
