#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Submitted inputs, oldest first, with an optional browsing cursor.
// Up/Down return the text to place in the input line; nullopt leaves the
// input untouched.
class CommandHistory {
public:
    // Appends unless it repeats the newest entry. Empty entries are ignored.
    void record(const std::string& entry);

    std::optional<std::string> previous();

    // Past the newest entry the cursor is cleared and "" is returned.
    std::optional<std::string> next();

    void reset_cursor() { cursor_.reset(); }

    const std::vector<std::string>& entries() const { return entries_; }
    std::optional<std::size_t> cursor() const { return cursor_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<std::string> entries_;
    std::optional<std::size_t> cursor_;
};
