#include "password_prompt.hpp"
#include <core/log.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

static const char* BUILTIN_PROMPT_PATTERN =
    "(password|passphrase|密码)\\s*(?::|：)?\\s*$";

PasswordPromptDetector::PasswordPromptDetector()
    : PasswordPromptDetector(std::vector<std::string>{}) {}

PasswordPromptDetector::PasswordPromptDetector(const std::vector<std::string>& extra_patterns) {
    patterns_.emplace_back(BUILTIN_PROMPT_PATTERN, std::regex::icase);
    for (const auto& pattern : extra_patterns) {
        try {
            patterns_.emplace_back(pattern, std::regex::icase);
        } catch (const std::regex_error& e) {
            rejected_.push_back(pattern);
            rterm_log(fmt::format("prompts: skipping invalid pattern '{}': {}", pattern, e.what()));
        }
    }
}

bool PasswordPromptDetector::is_prompt_line(const std::string& line) const {
    std::string trimmed = StringUtils::trim(line);
    if (trimmed.empty()) return false;
    for (const auto& re : patterns_) {
        if (std::regex_search(trimmed, re)) return true;
    }
    return false;
}

bool PasswordPromptDetector::matches(const std::string& text) const {
    for (const auto& line : StringUtils::split_lines(text)) {
        if (is_prompt_line(line)) return true;
    }
    return false;
}
