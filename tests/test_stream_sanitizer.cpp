#include <gtest/gtest.h>
#include <terminal/stream_sanitizer.hpp>
#include <string>
#include <vector>

using StreamSanitizer::State;

namespace {

std::string feed(const std::vector<std::string>& chunks) {
    State state;
    std::string out;
    for (const auto& chunk : chunks) {
        out += StreamSanitizer::sanitize(chunk, state);
    }
    return out + StreamSanitizer::finish(state);
}

// Samples that exercise every recognizer and the line assembler.
const std::vector<std::string> kSamples = {
    "\x1b[31mHello\x1b[0m\r\nWorld",
    "a\x1b]0;title\x07" "b",
    "x\x1b]2;t\x1b\\y",
    "p\x1b]0;t\xc2\x9cq",
    "caf\xc3\xa9 \xe2\x82\xac \xe2\x9b\x84",
    "\xc2\x9b" "1;2mok",
    "line1\r\nline2\rover\n",
    "\x1bPdata\x1b\\z",
    "a\tb\x08" "c\x7f",
    "\x1b(Bok\x1b" "7saved\x1b" "8",
    "a\x1b[1\nb",
    "$ \x1b[?2004hls\r\n\x1b[?2004l\rfile\r\n",
};

} // namespace

// ── Basic stripping ─────────────────────────────────────────────

TEST(StreamSanitizer, ColoredLines) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\x1b[31mHello\x1b[0m\r\nWorld", state), "Hello\nWorld");
}

TEST(StreamSanitizer, DropsBareControls) {
    State state;
    std::string input("a\x07" "b\0c\x7f" "d\te", 9);
    EXPECT_EQ(StreamSanitizer::sanitize(input, state), "abcd\te");
}

TEST(StreamSanitizer, OscTerminators) {
    State s1, s2, s3;
    EXPECT_EQ(StreamSanitizer::sanitize("a\x1b]0;title\x07" "b", s1), "ab");
    EXPECT_EQ(StreamSanitizer::sanitize("x\x1b]2;t\x1b\\y", s2), "xy");
    EXPECT_EQ(StreamSanitizer::sanitize("p\x1b]0;t\xc2\x9cq", s3), "pq");
}

TEST(StreamSanitizer, DcsIsDiscarded) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\x1bPdata\x1b\\z", state), "z");
}

TEST(StreamSanitizer, SimpleEscapes) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\x1b(Bok\x1b" "7saved\x1b" "8", state), "oksaved");
}

TEST(StreamSanitizer, C1CsiInUtf8Form) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\xc2\x9b" "31mred", state), "red");
}

TEST(StreamSanitizer, RawContinuationBytesAreText) {
    // U+26C4 is E2 9B 84: the 0x9B is part of a character, not a CSI.
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\xe2\x9b\x84", state), "\xe2\x9b\x84");
}

TEST(StreamSanitizer, MalformedCsiReprocessesOffendingByte) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("a\x1b[1\nb", state), "a\nb");
}

// ── Chunk boundaries ────────────────────────────────────────────

TEST(StreamSanitizer, CsiSplitAcrossChunks) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\x1b[1", state), "");
    EXPECT_EQ(StreamSanitizer::sanitize(";2m", state), "");
    EXPECT_TRUE(state.pending.empty());
    EXPECT_EQ(StreamSanitizer::sanitize("X", state), "X");
}

TEST(StreamSanitizer, UnterminatedOscIsHeld) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("a\x1b]0;ti", state), "a");
    EXPECT_EQ(state.pending, "\x1b]0;ti");
    EXPECT_EQ(StreamSanitizer::sanitize("tle\x07" "b", state), "b");
    EXPECT_TRUE(state.pending.empty());
}

TEST(StreamSanitizer, Utf8CharacterSplitAcrossChunks) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("caf\xc3", state), "caf");
    EXPECT_EQ(StreamSanitizer::sanitize("\xa9", state), "\xc3\xa9");
}

TEST(StreamSanitizer, CrLfSplitAcrossChunks) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("abc\r", state), "abc");
    EXPECT_TRUE(state.pending_cr);
    EXPECT_EQ(StreamSanitizer::sanitize("\ndef", state), "\ndef");
    EXPECT_FALSE(state.pending_cr);
}

TEST(StreamSanitizer, EveryTwoWaySplitMatchesWhole) {
    for (const auto& sample : kSamples) {
        std::string whole = feed({sample});
        for (std::size_t i = 0; i <= sample.size(); ++i) {
            EXPECT_EQ(feed({sample.substr(0, i), sample.substr(i)}), whole)
                << "sample #" << (&sample - &kSamples[0]) << " split at " << i;
        }
    }
}

TEST(StreamSanitizer, EveryThreeWaySplitMatchesWhole) {
    const std::string sample = "\x1b[31mok\x1b]0;t\x07\r\n\xc3\xa9\rx";
    std::string whole = feed({sample});
    for (std::size_t i = 0; i <= sample.size(); ++i) {
        for (std::size_t j = i; j <= sample.size(); ++j) {
            EXPECT_EQ(feed({sample.substr(0, i), sample.substr(i, j - i), sample.substr(j)}), whole)
                << "split at " << i << "," << j;
        }
    }
}

TEST(StreamSanitizer, ByteAtATimeMatchesWhole) {
    for (const auto& sample : kSamples) {
        std::vector<std::string> bytes;
        for (char c : sample) bytes.emplace_back(1, c);
        EXPECT_EQ(feed(bytes), feed({sample}));
    }
}

// ── Output properties ───────────────────────────────────────────

TEST(StreamSanitizer, OutputHasNoControlBytes) {
    for (const auto& sample : kSamples) {
        std::string out = feed({sample});
        for (unsigned char c : out) {
            bool allowed = c == '\n' || c == '\t' || (c >= 0x20 && c != 0x7F);
            EXPECT_TRUE(allowed) << "byte " << static_cast<int>(c);
        }
        EXPECT_EQ(out.find("\xc2\x9b"), std::string::npos);
        EXPECT_EQ(out.find("\xc2\x9c"), std::string::npos);
    }
}

TEST(StreamSanitizer, EmptyChunkEmitsNothing) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("partial", state), "partial");
    EXPECT_EQ(StreamSanitizer::sanitize("", state), "");
    EXPECT_EQ(StreamSanitizer::sanitize("", state), "");
    EXPECT_EQ(state.current_line, "partial");
    EXPECT_EQ(state.emitted_length, state.current_line.size());
}

TEST(StreamSanitizer, IncompleteLineEmittedOnce) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("ab", state), "ab");
    EXPECT_EQ(StreamSanitizer::sanitize("cd", state), "cd");
    EXPECT_EQ(StreamSanitizer::sanitize("\n", state), "\n");
    EXPECT_TRUE(state.current_line.empty());
    EXPECT_EQ(state.emitted_length, 0u);
}

TEST(StreamSanitizer, LoneCarriageReturnStartsNewLine) {
    State state;
    std::string out = StreamSanitizer::sanitize("progress 10%\rprogress 20%\n", state);
    EXPECT_EQ(out, "progress 10%\nprogress 20%\n");
}

TEST(StreamSanitizer, LoneCarriageReturnOnEmptyLineIsSilent) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("\rtext\n", state), "text\n");
}

TEST(StreamSanitizer, ResetClearsState) {
    State state;
    StreamSanitizer::sanitize("abc\x1b[3", state);
    EXPECT_FALSE(state.empty());
    state.reset();
    EXPECT_TRUE(state.empty());
    EXPECT_EQ(state.emitted_length, 0u);
}

// ── Wrappers ────────────────────────────────────────────────────

TEST(StreamSanitizer, ChunkWithOnlyLineBreakReportsNewline) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize_chunk("\x1b]0;a\nb\x07", state), "\n");
    EXPECT_EQ(StreamSanitizer::sanitize_chunk("", state), "");
    EXPECT_EQ(StreamSanitizer::sanitize_chunk("\x1b[0m", state), "");
}

TEST(StreamSanitizer, HeldCarriageReturnIsNotReportedTwice) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize_chunk("\x1b[2K\r", state), "");
    EXPECT_TRUE(state.pending_cr);
    EXPECT_EQ(StreamSanitizer::sanitize_chunk("\n", state), "\n");
}

TEST(StreamSanitizer, ChunkedCarriageReturnMatchesWhole) {
    auto chunked = [](const std::vector<std::string>& chunks) {
        State state;
        std::string out;
        for (const auto& chunk : chunks) out += StreamSanitizer::sanitize_chunk(chunk, state);
        return out;
    };
    EXPECT_EQ(chunked({"foo", "\r", "\n"}), chunked({"foo\r\n"}));
    EXPECT_EQ(chunked({"foo", "\r", "\n"}), "foo\n");
    EXPECT_EQ(chunked({"50%", "\r", "60%"}), chunked({"50%\r60%"}));
    EXPECT_EQ(chunked({"50%", "\r", "60%"}), "50%\n60%");
    EXPECT_EQ(chunked({"a", "\r", "\nb"}), "a\nb");
}

TEST(StreamSanitizer, SanitizeOnceUsesFreshState) {
    EXPECT_EQ(StreamSanitizer::sanitize_once("Connected\r\n"), "Connected\n");
    EXPECT_EQ(StreamSanitizer::sanitize_once("\x1b[1mbold\x1b[0m"), "bold");
    EXPECT_EQ(StreamSanitizer::sanitize_once("\x1b[0m"), "");
    EXPECT_EQ(StreamSanitizer::sanitize_once("\x1b[0m\r"), "\n");
    EXPECT_EQ(StreamSanitizer::sanitize_once("cut \x1b]0;never closed"), "cut ");
}

TEST(StreamSanitizer, FinishResolvesHeldCarriageReturn) {
    State state;
    EXPECT_EQ(StreamSanitizer::sanitize("done\r", state), "done");
    EXPECT_EQ(StreamSanitizer::finish(state), "\n");
    EXPECT_TRUE(state.empty());
}
