#include "string_utils.hpp"

namespace StringUtils {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split_lines(const std::string& str) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find('\n', start);
        std::string line = str.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return lines;
}

} // namespace StringUtils
