#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::string trim(const std::string& str);

// Split on "\n" and "\r\n". A trailing empty segment is kept.
std::vector<std::string> split_lines(const std::string& str);
}
