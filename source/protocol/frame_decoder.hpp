#ifndef MCPHOST_FRAME_DECODER_HPP
#define MCPHOST_FRAME_DECODER_HPP

// Newline-delimited framing for the stdio transport.
// Outbound messages are one JSON document per line; inbound bytes arrive in
// arbitrary chunks and are re-assembled into complete lines here.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace frame_decoder {

// Serialize a message as a single frame (compact JSON + '\n').
// Strings holding invalid UTF-8 are written with U+FFFD instead of throwing.
std::string encode_frame(const nlohmann::json &message);

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
std::string sanitize_utf8(const std::string &text);

class FrameDecoder {
public:
    // Frames longer than this without a newline are dropped as garbage.
    static constexpr std::size_t kMaxFrameBytes = 16 * 1024 * 1024;

    // Append bytes and return every frame completed by them.
    // Trailing '\r' is stripped, blank lines are skipped.
    std::vector<std::string> feed(const char *data, std::size_t length);
    std::vector<std::string> feed(const std::string &bytes);

    // Discard a partially received frame.
    void reset();

    std::size_t buffered_bytes() const { return buffer_.size(); }

    // Number of oversized partial frames thrown away so far.
    std::size_t dropped_frames() const { return dropped_frames_; }

private:
    std::string buffer_;
    // Leading bytes of buffer_ already known to hold no newline.
    std::size_t scanned_bytes_ = 0;
    std::size_t dropped_frames_ = 0;
};

} // namespace frame_decoder

#endif // MCPHOST_FRAME_DECODER_HPP
