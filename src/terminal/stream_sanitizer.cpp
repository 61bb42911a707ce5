#include "stream_sanitizer.hpp"

namespace StreamSanitizer {

// ── Internal helpers ────────────────────────────────────────────

namespace {

constexpr unsigned char ESC = 0x1B;
constexpr unsigned char BEL = 0x07;
constexpr unsigned char C1_LEAD = 0xC2;   // UTF-8 lead byte of U+0080..U+00BF
constexpr unsigned char C1_CSI = 0x9B;
constexpr unsigned char C1_ST = 0x9C;

// Returned by the scanners when the input ends inside a sequence.
constexpr std::size_t INCOMPLETE = std::string::npos;

inline unsigned char at(const std::string& s, std::size_t i) {
    return static_cast<unsigned char>(s[i]);
}

bool is_dropped_control(unsigned char c) {
    return c <= 0x08 || c == 0x0B || c == 0x0C ||
           (c >= 0x0E && c <= 0x1F) || c == 0x7F;
}

bool is_c1(const std::string& s, std::size_t i, unsigned char code) {
    return at(s, i) == C1_LEAD && i + 1 < s.size() && at(s, i + 1) == code;
}

// Expected UTF-8 sequence length for a lead byte; 0 for anything else.
std::size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// True if s[i..] is a valid but truncated UTF-8 sequence.
bool is_truncated_utf8(const std::string& s, std::size_t i) {
    std::size_t len = utf8_length(at(s, i));
    if (len < 2 || i + len <= s.size()) return false;
    for (std::size_t j = i + 1; j < s.size(); ++j) {
        if ((at(s, j) & 0xC0) != 0x80) return false;
    }
    return true;
}

// The scanners take the index of the first byte after the introducer and
// return the index where normal processing resumes. Everything before that
// index is discarded. A malformed sequence ends at the offending byte, which
// is then processed on its own.

// CSI: parameters 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E.
std::size_t scan_csi(const std::string& s, std::size_t j) {
    while (j < s.size()) {
        unsigned char c = at(s, j);
        if (c >= 0x40 && c <= 0x7E) return j + 1;
        if (c >= 0x20 && c <= 0x3F) { ++j; continue; }
        return j;
    }
    return INCOMPLETE;
}

// OSC / DCS / SOS / PM / APC: payload up to BEL, ESC \ or ST.
std::size_t scan_string(const std::string& s, std::size_t j) {
    while (j < s.size()) {
        unsigned char c = at(s, j);
        if (c == BEL) return j + 1;
        if (c == ESC) {
            if (j + 1 >= s.size()) return INCOMPLETE;
            if (s[j + 1] == '\\') return j + 2;
            return j;   // ESC cancels the string and starts a new sequence
        }
        if (c == C1_LEAD) {
            if (j + 1 >= s.size()) return INCOMPLETE;
            if (at(s, j + 1) == C1_ST) return j + 2;
        }
        ++j;
    }
    return INCOMPLETE;
}

// Two-byte (nF / Fp / Fe / Fs) escapes: intermediates 0x20-0x2F, final 0x30-0x7E.
std::size_t scan_simple(const std::string& s, std::size_t j) {
    while (j < s.size()) {
        unsigned char c = at(s, j);
        if (c >= 0x20 && c <= 0x2F) { ++j; continue; }
        if (c >= 0x30 && c <= 0x7E) return j + 1;
        return j;
    }
    return INCOMPLETE;
}

std::size_t scan_escape(const std::string& s, std::size_t i) {
    if (i + 1 >= s.size()) return INCOMPLETE;
    switch (s[i + 1]) {
        case '[':
            return scan_csi(s, i + 2);
        case ']':
        case 'P':
        case 'X':
        case '^':
        case '_':
            return scan_string(s, i + 2);
        default:
            return scan_simple(s, i + 1);
    }
}

// Recognition pass: strip sequences and bare controls from pending + chunk.
// Leaves any unconfirmed tail in state.pending.
std::string strip_controls(const std::string& chunk, State& state) {
    std::string in;
    in.swap(state.pending);
    in += chunk;

    std::string text;
    text.reserve(in.size());

    std::size_t i = 0;
    while (i < in.size()) {
        unsigned char c = at(in, i);

        if (c == ESC || is_c1(in, i, C1_CSI)) {
            std::size_t end = (c == ESC) ? scan_escape(in, i) : scan_csi(in, i + 2);
            if (end == INCOMPLETE) {
                state.pending = in.substr(i);
                break;
            }
            i = end;
            continue;
        }

        if (c >= 0x80) {
            if (is_truncated_utf8(in, i)) {
                state.pending = in.substr(i);
                break;
            }
            text += static_cast<char>(c);
            ++i;
            continue;
        }

        if (!is_dropped_control(c)) {
            text += static_cast<char>(c);
        }
        ++i;
    }

    return text;
}

void commit_line(State& state, std::string& out) {
    out.append(state.current_line, state.emitted_length, std::string::npos);
    state.current_line.clear();
    state.emitted_length = 0;
}

} // namespace

// ── Public API ──────────────────────────────────────────────────

void State::reset() {
    pending.clear();
    current_line.clear();
    emitted_length = 0;
    pending_cr = false;
}

bool State::empty() const {
    return pending.empty() && current_line.empty() && !pending_cr;
}

std::string sanitize(const std::string& chunk, State& state) {
    std::string text = strip_controls(chunk, state);

    if (state.pending_cr && !text.empty()) {
        text.insert(text.begin(), '\r');
        state.pending_cr = false;
    }

    std::string out;
    for (std::size_t k = 0; k < text.size(); ++k) {
        char ch = text[k];
        if (ch == '\n') {
            commit_line(state, out);
            out += '\n';
        } else if (ch == '\r') {
            if (k + 1 == text.size()) {
                state.pending_cr = true;
                break;
            }
            if (text[k + 1] == '\n') {
                commit_line(state, out);
                out += '\n';
                ++k;
            } else {
                // Lone CR: the line is about to be overwritten. Column
                // repainting is not modelled; the next text starts a new line.
                bool had_content = !state.current_line.empty();
                commit_line(state, out);
                if (had_content) out += '\n';
            }
        } else {
            state.current_line += ch;
        }
    }

    out.append(state.current_line, state.emitted_length, std::string::npos);
    state.emitted_length = state.current_line.size();
    return out;
}

std::string sanitize_chunk(const std::string& chunk, State& state) {
    std::string out = sanitize(chunk, state);
    // A held '\r' is resolved, and its break emitted, by the next chunk.
    if (out.empty() && !state.pending_cr && chunk.find_first_of("\r\n") != std::string::npos) {
        return "\n";
    }
    return out;
}

std::string finish(State& state) {
    std::string out;
    if (state.pending_cr) {
        state.pending_cr = false;
        bool had_content = !state.current_line.empty();
        commit_line(state, out);
        if (had_content) out += '\n';
    }
    state.pending.clear();
    return out;
}

std::string sanitize_once(const std::string& text) {
    State state;
    std::string out = sanitize(text, state);
    out += finish(state);
    if (out.empty() && text.find_first_of("\r\n") != std::string::npos) {
        return "\n";
    }
    return out;
}

} // namespace StreamSanitizer
