#pragma once

#include <string>
#include <string_view>

namespace eventship::util {

/*
  Expands %NAME% references from the process environment. References to
  unset variables are left verbatim, "%%" is a literal percent.
*/
std::string ExpandEnvironmentStrings(std::string_view value);

} // namespace eventship::util
