#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <core/config.hpp>
#include <session/session_controller.hpp>
#include <ssh/ssh_transport.hpp>

// Interactive console: a readline prompt multiplexed with transport
// events. Lines starting with ':' are local commands; everything else is
// submitted to the session.
class ConsoleCLI {
public:
    explicit ConsoleCLI(Config config);
    ~ConsoleCLI();

    ConsoleCLI(const ConsoleCLI&) = delete;
    ConsoleCLI& operator=(const ConsoleCLI&) = delete;

    // Runs until :quit or EOF. If target is set ("user@host[:port]"),
    // connects to it first. Returns the process exit code.
    int run(const std::optional<std::string>& target);

    using CommandHandler = std::function<void(ConsoleCLI&, const std::string&)>;

    void add_command(const std::string& name, CommandHandler handler, const std::string& help);
    void execute_line(const std::string& line);
    void print_help() const;

private:
    // ── Local commands ─────────────────────────────────────
    void cmd_connect(const std::string& args);
    void cmd_disconnect();
    void cmd_shell();
    void cmd_status();

    std::optional<std::string> read_password(const std::string& prompt);

    // ── Display ────────────────────────────────────────────
    void render_transcript();
    void print_above_prompt(const std::string& text, bool ends_open);
    std::string prompt_string(bool readline_markers) const;
    void refresh_prompt();
    void set_input(const std::string& text);
    void check_input_edited();
    void update_masking();

    // ── readline glue ──────────────────────────────────────
    void install_readline();
    void remove_readline();
    static void on_line(char* raw);
    static int on_history_up(int count, int key);
    static int on_history_down(int count, int key);
    static void masked_redisplay();

    Config config_;
    SshTransport transport_;
    SessionController controller_;

    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

    // Transcript rendering progress: records before the last seen one never
    // change, so only the tail of the last record is re-examined.
    std::size_t rendered_count_ = 0;
    std::size_t rendered_length_ = 0;

    std::string current_prompt_;
    std::string last_input_;
    bool readline_installed_ = false;
    bool masked_ = false;
    bool quit_ = false;
};
