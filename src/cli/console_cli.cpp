#include "console_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <readline/readline.h>

// readline callbacks are plain functions; they reach the console through this.
static ConsoleCLI* g_console = nullptr;

static SessionOptions make_options(const Config& cfg) {
    SessionOptions options;
    options.connect_timeout = std::chrono::seconds(cfg.session().connect_timeout);
    options.prompts = PasswordPromptDetector(cfg.prompts().extra_patterns);
    return options;
}

// ── Construction / Destruction ──────────────────────────────

ConsoleCLI::ConsoleCLI(Config config)
    : config_(std::move(config)),
      transport_([this](Event event) { controller_.post(std::move(event)); },
                 config_.connection().timeout),
      controller_(transport_, make_options(config_), config_.session().merge_messages) {
    controller_.set_input_callback([this](const std::string& text) { set_input(text); });

    add_command("connect", [](ConsoleCLI& cli, const std::string& args) { cli.cmd_connect(args); },
                "Open a connection: :connect [user@host[:port]]");
    add_command("disconnect", [](ConsoleCLI& cli, const std::string&) { cli.cmd_disconnect(); },
                "Close the connection");
    add_command("shell", [](ConsoleCLI& cli, const std::string&) { cli.cmd_shell(); },
                "Start or stop the interactive shell");
    add_command("status", [](ConsoleCLI& cli, const std::string&) { cli.cmd_status(); },
                "Show session status");
    add_command("help", [](ConsoleCLI& cli, const std::string&) { cli.print_help(); },
                "Show this help");
    add_command("quit", [](ConsoleCLI& cli, const std::string&) { cli.quit_ = true; },
                "Exit rterm");
}

ConsoleCLI::~ConsoleCLI() {
    remove_readline();
    // The transport thread posts into the controller; stop it first.
    transport_.stop();
    if (g_console == this) g_console = nullptr;
}

// ── Main loop ───────────────────────────────────────────────

int ConsoleCLI::run(const std::optional<std::string>& target) {
    auto started = transport_.start();
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }

    std::cout << theme::banner(RTERM_VERSION);
    std::cout << theme::dim("    Type :help for commands, :quit to exit.") << "\n\n";

    for (const auto& pattern : controller_.options().prompts.rejected_patterns()) {
        std::cout << theme::fail(fmt::format("Ignoring invalid prompt pattern: {}", pattern));
    }

    if (target) {
        cmd_connect(*target);
    }

    install_readline();
    while (!quit_) {
        if (platform::poll_stdin(CLI_POLL_MS)) {
            rl_callback_read_char();
            check_input_edited();
        }
        controller_.pump();
        controller_.poll();
        render_transcript();
        update_masking();
        refresh_prompt();
    }
    remove_readline();

    rterm_log("cli: exiting");
    std::cout << "\n";
    return 0;
}

// ── Commands ────────────────────────────────────────────────

void ConsoleCLI::add_command(const std::string& name, CommandHandler handler, const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

void ConsoleCLI::execute_line(const std::string& line) {
    // "::text" submits ":text" literally
    if (line.size() >= 2 && line[0] == ':' && line[1] == ':') {
        controller_.submit(line.substr(1));
        return;
    }

    if (line.empty() || line[0] != ':') {
        controller_.submit(line);
        return;
    }

    std::istringstream iss(line.substr(1));
    std::string command;
    iss >> command;
    std::string args;
    std::getline(iss, args);
    trim(args);

    if (command == "exit") command = "quit";

    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: :" + command);
        std::cout << theme::step("Type ':help' for available commands.");
        return;
    }

    rterm_log("cli: :" + command);
    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void ConsoleCLI::print_help() const {
    static const char* order[] = {"connect", "disconnect", "shell", "status", "help", "quit"};

    std::cout << theme::section("Commands");
    for (const char* name : order) {
        auto it = commands_.find(name);
        if (it == commands_.end()) continue;
        std::cout << theme::color::BLUE
                  << fmt::format("    :{:<13}", name)
                  << theme::color::RESET
                  << theme::color::DIM
                  << it->second.second
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
    std::cout << theme::dim("    Any other line is sent to the remote side: as a command, as input") << "\n";
    std::cout << theme::dim("    to the running command, or to the shell. Start a line with '::' to") << "\n";
    std::cout << theme::dim("    send a literal ':'. Up/Down recall previous input.") << "\n\n";
}

void ConsoleCLI::cmd_connect(const std::string& args) {
    const auto& defaults = config_.connection();
    ConnectForm form;
    form.host = defaults.host;
    form.port = defaults.port;
    form.username = defaults.user;

    std::string target = args;
    trim(target);
    if (!target.empty() && !parse_ssh_target(target, form.username, form.host, form.port)) {
        std::cout << theme::fail("Invalid target: " + target);
        std::cout << theme::step("Usage: :connect user@host[:port]");
        return;
    }

    // The controller reports a missing host or user; only ask for a
    // password when the request can go out.
    if (!form.host.empty() && !form.username.empty() &&
        controller_.connection() != ConnectionState::Connecting) {
        auto password = read_password(fmt::format("    Password for {}@{}: ", form.username, form.host));
        if (!password) {
            std::cout << theme::fail("Password entry aborted.");
            return;
        }
        form.password = *password;
    }

    controller_.connect(form);
}

void ConsoleCLI::cmd_disconnect() {
    if (controller_.connection() == ConnectionState::Disconnected) {
        std::cout << theme::info("Not connected.");
        return;
    }
    controller_.disconnect();
}

void ConsoleCLI::cmd_shell() {
    if (controller_.connection() != ConnectionState::Connected) {
        std::cout << theme::fail("Not connected.");
        return;
    }
    if (controller_.state().shell_toggling) {
        std::cout << theme::info("Shell request already pending.");
        return;
    }
    controller_.toggle_shell();
}

void ConsoleCLI::cmd_status() {
    const auto& st = controller_.state();

    std::cout << theme::section("Status");
    std::cout << theme::kv("Connection", to_string(st.connection));
    if (st.connection != ConnectionState::Disconnected) {
        std::cout << theme::kv("Target", fmt::format("{}@{}:{}", st.form.username, st.form.host, st.form.port));
    }
    std::cout << theme::kv("Command", st.command_running ? "running" : "idle");
    std::cout << theme::kv("Shell", st.shell_toggling ? "switching" : (st.shell_active ? "active" : "inactive"));
    std::cout << theme::kv("History", std::to_string(st.history.entries().size()));
    std::cout << theme::kv("Messages", std::to_string(controller_.transcript().size()));
    std::cout << theme::kv("Log", rterm_log_path());
    std::cout << "\n";
}

std::optional<std::string> ConsoleCLI::read_password(const std::string& prompt) {
    bool had_readline = readline_installed_;
    if (had_readline) remove_readline();

    std::cout << prompt << std::flush;
    std::string password;
    bool got;
    {
        platform::EchoOffGuard no_echo;
        got = static_cast<bool>(std::getline(std::cin, password));
    }
    std::cout << "\n";
    if (!got) std::cin.clear();

    if (had_readline) install_readline();
    if (!got) return std::nullopt;
    return password;
}

// ── Display ─────────────────────────────────────────────────

void ConsoleCLI::render_transcript() {
    const auto& messages = controller_.transcript().messages();
    if (messages.size() < rendered_count_) {
        rendered_count_ = 0;
        rendered_length_ = 0;
    }

    std::string out;
    bool ends_open = false;
    std::size_t first = rendered_count_ > 0 ? rendered_count_ - 1 : 0;
    for (std::size_t i = first; i < messages.size(); ++i) {
        const Message& msg = messages[i];
        std::size_t from = (rendered_count_ > 0 && i == rendered_count_ - 1) ? rendered_length_ : 0;
        if (from >= msg.content.size()) continue;

        if (msg.role == Role::User) {
            if (ends_open) out += '\n';
            out += theme::user_line(msg.content);
            ends_open = false;
        } else {
            std::string piece = msg.content.substr(from);
            if (from == 0 && ends_open) out += '\n';
            out += theme::server_text(piece, msg.is_error);
            ends_open = piece.back() != '\n';
        }
    }

    rendered_count_ = messages.size();
    rendered_length_ = messages.empty() ? 0 : messages.back().content.size();

    if (!out.empty()) print_above_prompt(out, ends_open);
}

void ConsoleCLI::print_above_prompt(const std::string& text, bool ends_open) {
    if (!readline_installed_) {
        std::cout << text;
        if (ends_open) std::cout << "\n";
        std::cout.flush();
        return;
    }

    char* saved_line = rl_copy_text(0, rl_end);
    int saved_point = rl_point;
    rl_save_prompt();
    rl_replace_line("", 0);
    rl_redisplay();

    std::cout << "\r\033[K" << text;
    if (ends_open) std::cout << "\n";
    std::cout.flush();

    rl_restore_prompt();
    rl_replace_line(saved_line, 0);
    rl_point = saved_point;
    rl_forced_update_display();
    std::free(saved_line);
}

std::string ConsoleCLI::prompt_string(bool readline_markers) const {
    // Readline needs non-printing sequences wrapped in \001 ... \002 to
    // compute the visible prompt width.
    auto esc = [readline_markers](const std::string& code) {
        return readline_markers ? std::string("\001") + code + std::string("\002") : code;
    };

    const auto& st = controller_.state();
    std::string prompt = esc(theme::color::BROWN) + "rterm" + esc(theme::color::RESET);

    switch (st.connection) {
        case ConnectionState::Disconnected:
            break;
        case ConnectionState::Connecting:
            prompt += ":" + esc(theme::color::YELLOW) + "connecting" + esc(theme::color::RESET);
            break;
        case ConnectionState::Connected:
            prompt += ":" + esc(theme::color::GREEN) + st.form.username + "@" + st.form.host
                    + esc(theme::color::RESET);
            if (st.shell_active) {
                prompt += ":" + esc(theme::color::BLUE) + "shell" + esc(theme::color::RESET);
            } else if (st.command_running) {
                prompt += ":" + esc(theme::color::BLUE) + "input" + esc(theme::color::RESET);
            }
            break;
    }
    return prompt + "> ";
}

void ConsoleCLI::refresh_prompt() {
    std::string prompt = prompt_string(true);
    if (prompt == current_prompt_) return;
    current_prompt_ = prompt;
    if (readline_installed_) {
        rl_set_prompt(current_prompt_.c_str());
        rl_forced_update_display();
    }
}

void ConsoleCLI::set_input(const std::string& text) {
    last_input_ = text;
    if (!readline_installed_) return;
    rl_replace_line(text.c_str(), 0);
    rl_point = rl_end;
}

void ConsoleCLI::check_input_edited() {
    if (!readline_installed_ || !rl_line_buffer) return;
    std::string now(rl_line_buffer, static_cast<std::size_t>(rl_end));
    if (now != last_input_) {
        last_input_ = now;
        controller_.input_edited();
    }
}

void ConsoleCLI::update_masking() {
    bool mask = controller_.state().mask_next_input;
    if (mask == masked_) return;
    masked_ = mask;
    rl_redisplay_function = masked_ ? &ConsoleCLI::masked_redisplay : rl_redisplay;
    if (readline_installed_) rl_forced_update_display();
}

// ── readline glue ───────────────────────────────────────────

void ConsoleCLI::install_readline() {
    if (readline_installed_) return;
    g_console = this;
    current_prompt_ = prompt_string(true);
    rl_callback_handler_install(current_prompt_.c_str(), &ConsoleCLI::on_line);
    rl_bind_keyseq("\\e[A", &ConsoleCLI::on_history_up);
    rl_bind_keyseq("\\e[B", &ConsoleCLI::on_history_down);
    rl_bind_keyseq("\\eOA", &ConsoleCLI::on_history_up);
    rl_bind_keyseq("\\eOB", &ConsoleCLI::on_history_down);
    readline_installed_ = true;
}

void ConsoleCLI::remove_readline() {
    if (!readline_installed_) return;
    rl_callback_handler_remove();
    readline_installed_ = false;
}

void ConsoleCLI::on_line(char* raw) {
    ConsoleCLI* self = g_console;
    if (!self) {
        std::free(raw);
        return;
    }

    if (!raw) {   // EOF / Ctrl-D
        self->quit_ = true;
        return;
    }

    std::string line = raw;
    std::free(raw);
    self->last_input_.clear();
    self->execute_line(line);
}

int ConsoleCLI::on_history_up(int /*count*/, int /*key*/) {
    if (g_console) g_console->controller_.history_previous();
    return 0;
}

int ConsoleCLI::on_history_down(int /*count*/, int /*key*/) {
    if (g_console) g_console->controller_.history_next();
    return 0;
}

// Shows the prompt followed by one '*' per typed character.
void ConsoleCLI::masked_redisplay() {
    std::string prompt = g_console ? g_console->prompt_string(false) : "";
    std::string stars(static_cast<std::size_t>(rl_end), '*');
    std::fprintf(rl_outstream, "\r\033[K%s%s", prompt.c_str(), stars.c_str());
    std::fflush(rl_outstream);
}
