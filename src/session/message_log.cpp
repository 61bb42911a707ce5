#include "message_log.hpp"

const Message& MessageLog::append(Role role, const std::string& content, bool is_error,
                                  bool stream) {
    bool continues_line = stream && open_line_;
    open_line_ = stream && role == Role::Server && !content.empty() && content.back() != '\n';

    if (merge_ && role == Role::Server && !messages_.empty()) {
        Message& last = messages_.back();
        if (last.role == Role::Server && last.is_error == is_error) {
            bool needs_break = !continues_line && !last.content.empty() && !content.empty() &&
                               last.content.back() != '\n' && content.front() != '\n';
            if (needs_break) last.content += '\n';
            last.content += content;
            return last;
        }
    }

    Message msg;
    msg.id = next_id_++;
    msg.role = role;
    msg.content = content;
    msg.is_error = is_error;
    messages_.push_back(std::move(msg));
    return messages_.back();
}
