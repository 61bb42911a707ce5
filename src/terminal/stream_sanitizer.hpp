#pragma once

#include <cstddef>
#include <string>

// Stream sanitizer: turns raw remote terminal output into plain text.
//
// Remote output arrives in arbitrary chunks. Escape sequences (CSI, OSC,
// DCS/SOS/PM/APC, two-byte escapes) are removed even when a chunk boundary
// splits them. Bare C0 controls are dropped, and carriage returns are folded
// into line breaks. Input and output are UTF-8; the C1 controls U+009B (CSI)
// and U+009C (ST) are recognized in their encoded form (C2 9B / C2 9C).
//
// Each output channel owns one State. Feeding the same byte stream through
// sanitize() in any partition yields the same concatenated output.
namespace StreamSanitizer {

struct State {
    // Unconfirmed tail of the previous input: an unterminated escape
    // sequence or an incomplete UTF-8 character. Retried on the next call.
    std::string pending;

    // The terminal's current line and how much of it was already returned.
    // Invariant: emitted_length <= current_line.size().
    std::string current_line;
    std::size_t emitted_length = 0;

    // The last escape-free character seen was '\r'; whether it starts a
    // CR/LF pair is decided by the next character.
    bool pending_cr = false;

    void reset();
    bool empty() const;
};

// Consume a chunk; return only the newly revealed text. Never fails.
std::string sanitize(const std::string& chunk, State& state);

// sanitize(), plus the display signal: a chunk that contained a line break
// but produced no text reports "\n". A trailing '\r' still held in
// state.pending_cr does not count; the next chunk emits that break.
std::string sanitize_chunk(const std::string& chunk, State& state);

// Resolve whatever is still undecided at the end of a stream: a held '\r'
// acts as a lone carriage return, and an unterminated sequence is discarded.
std::string finish(State& state);

// One-shot sanitize for self-contained text (status messages): fresh state,
// finish() applied, and the same line-break signal as sanitize_chunk().
std::string sanitize_once(const std::string& text);

} // namespace StreamSanitizer
