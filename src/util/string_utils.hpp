#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
// Well-formed UTF-8: no overlong forms, surrogates, or code points past U+10FFFF.
bool is_valid_utf8(const std::string& str);
}
