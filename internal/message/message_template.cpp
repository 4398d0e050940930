#include "message_template.hpp"

namespace eventship::message {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

} // namespace

std::string RenderTemplate(std::string_view format, const std::vector<std::string>& inserts) {
  std::string out;
  out.reserve(format.size());

  std::size_t i = 0;
  while (i < format.size()) {
    const char c = format[i];
    if (c != '%') {
      out.push_back(c);
      ++i;
      continue;
    }

    if (i + 1 >= format.size()) {
      out.push_back('%');
      break;
    }

    const char directive = format[i + 1];
    if (directive >= '1' && directive <= '9') {
      std::size_t index = static_cast<std::size_t>(directive - '0');
      i += 2;
      if (i < format.size() && IsDigit(format[i])) {
        index = index * 10 + static_cast<std::size_t>(format[i] - '0');
        ++i;
      }
      // %1!s! style printf directive
      if (i < format.size() && format[i] == '!') {
        const auto close = format.find('!', i + 1);
        i                = close == std::string_view::npos ? format.size() : close + 1;
      }
      if (index <= inserts.size()) {
        out += inserts[index - 1];
      }
      continue;
    }

    i += 2;
    switch (directive) {
      case '0':
        return out;
      case 'n':
        out += "\r\n";
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'b':
        out.push_back(' ');
        break;
      default:
        out.push_back(directive);
        break;
    }
  }
  return out;
}

std::string_view TrimLineBreaks(std::string_view text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

} // namespace eventship::message
