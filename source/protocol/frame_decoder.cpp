#include "protocol/frame_decoder.hpp"

namespace frame_decoder {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD

// Expected sequence length for a lead byte, or 0 if the byte cannot start one.
std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool valid_sequence(const std::string &text, std::size_t position, std::size_t length) {
    if (length == 0 || position + length > text.size()) {
        return false;
    }
    for (std::size_t offset = 1; offset < length; ++offset) {
        unsigned char byte = static_cast<unsigned char>(text[position + offset]);
        if ((byte & 0xC0u) != 0x80u) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string encode_frame(const nlohmann::json &message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string sanitize_utf8(const std::string &text) {
    std::string result;
    result.reserve(text.size());

    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(static_cast<unsigned char>(text[position]));
        if (!valid_sequence(text, position, length)) {
            result += kReplacementUtf8;
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }
    return result;
}

std::vector<std::string> FrameDecoder::feed(const char *data, std::size_t length) {
    std::vector<std::string> frames;
    buffer_.append(data, length);

    std::size_t line_start = 0;
    std::size_t newline_position = buffer_.find('\n', scanned_bytes_);
    while (newline_position != std::string::npos) {
        std::string line = buffer_.substr(line_start, newline_position - line_start);
        line_start = newline_position + 1;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            frames.push_back(sanitize_utf8(line));
        }
        newline_position = buffer_.find('\n', line_start);
    }
    buffer_.erase(0, line_start);
    scanned_bytes_ = buffer_.size();

    if (buffer_.size() > kMaxFrameBytes) {
        buffer_.clear();
        scanned_bytes_ = 0;
        ++dropped_frames_;
    }
    return frames;
}

std::vector<std::string> FrameDecoder::feed(const std::string &bytes) {
    return feed(bytes.data(), bytes.size());
}

void FrameDecoder::reset() {
    buffer_.clear();
    scanned_bytes_ = 0;
}

} // namespace frame_decoder
