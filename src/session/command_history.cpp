#include "command_history.hpp"

void CommandHistory::record(const std::string& entry) {
    if (entry.empty()) return;
    if (!entries_.empty() && entries_.back() == entry) return;
    entries_.push_back(entry);
}

std::optional<std::string> CommandHistory::previous() {
    if (entries_.empty()) return std::nullopt;
    if (!cursor_) {
        cursor_ = entries_.size() - 1;
    } else if (*cursor_ > 0) {
        --*cursor_;
    }
    return entries_[*cursor_];
}

std::optional<std::string> CommandHistory::next() {
    if (entries_.empty() || !cursor_) return std::nullopt;
    if (*cursor_ + 1 >= entries_.size()) {
        cursor_.reset();
        return std::string();
    }
    ++*cursor_;
    return entries_[*cursor_];
}
