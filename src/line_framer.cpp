#include "esplink/line_framer.hpp"

namespace esplink {

namespace {

const char* const kReplacement = "\xEF\xBF\xBD";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Length of the valid UTF-8 sequence starting at s[i], 0 if malformed
size_t utf8SequenceLength(const std::string& s, size_t i) {
    const auto byte = [&](size_t k) { return static_cast<uint8_t>(s[k]); };
    uint8_t lead = byte(i);

    size_t len;
    uint32_t min_cp;
    uint32_t cp;
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2; min_cp = 0x80; cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3; min_cp = 0x800; cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4; min_cp = 0x10000; cp = lead & 0x07;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; k++) {
        uint8_t b = byte(i + k);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range code points
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

} // namespace

std::vector<std::string> LineFramer::feed(const uint8_t* data, size_t size) {
    buffer_.append(reinterpret_cast<const char*>(data), size);

    std::vector<std::string> frames;
    size_t start = 0;
    size_t pos;
    while ((pos = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = trim(sanitizeUtf8(buffer_.substr(start, pos - start)));
        start = pos + 1;
        if (!line.empty()) {
            frames.push_back(std::move(line));
        }
    }
    buffer_.erase(0, start);
    return frames;
}

std::vector<std::string> LineFramer::feed(const std::string& chunk) {
    return feed(reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size());
}

std::string LineFramer::printable(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size);
    for (size_t i = 0; i < size; i++) {
        char c = static_cast<char>(data[i]);
        if ((data[i] >= 0x20 && data[i] <= 0x7E) || c == '\n' || c == '\r' || c == '\t') {
            out.push_back(c);
        }
    }
    return out;
}

std::string LineFramer::sanitizeUtf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8SequenceLength(text, i);
        if (len == 0) {
            out.append(kReplacement);
            i++;
        } else {
            out.append(text, i, len);
            i += len;
        }
    }
    return out;
}

} // namespace esplink
