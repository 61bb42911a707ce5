#pragma once

#include <string>
#include <vector>

enum class Role {
    User,
    Server,
};

struct Message {
    int id = 0;
    Role role = Role::Server;
    std::string content;
    bool is_error = false;
};

// The session transcript. Consecutive server messages with the same error
// flag are merged into one record, which keeps its id. Ids start at 1 and
// are never reused.
class MessageLog {
public:
    explicit MessageLog(bool merge = true) : merge_(merge) {}

    // Returns the record that now holds the content (new or merged).
    // A stream delta that continues an open line of the previous stream
    // delta is joined without a separator.
    const Message& append(Role role, const std::string& content, bool is_error = false,
                          bool stream = false);

    const std::vector<Message>& messages() const { return messages_; }
    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

    // Drops all records; ids keep counting.
    void clear() { messages_.clear(); }

private:
    std::vector<Message> messages_;
    int next_id_ = 1;
    bool merge_;
    // The last append was a stream delta that ended mid-line.
    bool open_line_ = false;
};
