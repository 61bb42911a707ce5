#pragma once

#include <regex>
#include <string>
#include <vector>

// Recognizes remote password prompts in sanitized server text.
// A line is a prompt when, trimmed, it ends with "password", "passphrase"
// or "密码" (any case), optionally followed by ':' or '：'.
class PasswordPromptDetector {
public:
    PasswordPromptDetector();

    // Extra ECMAScript patterns, matched case-insensitively against each
    // trimmed line. Invalid patterns are skipped and logged.
    explicit PasswordPromptDetector(const std::vector<std::string>& extra_patterns);

    bool is_prompt_line(const std::string& line) const;

    // True if any line of the text is a prompt.
    bool matches(const std::string& text) const;

    const std::vector<std::string>& rejected_patterns() const { return rejected_; }

private:
    std::vector<std::regex> patterns_;
    std::vector<std::string> rejected_;
};
