#ifndef ESPLINK_LINE_FRAMER_HPP
#define ESPLINK_LINE_FRAMER_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace esplink {

/**
 * @brief Splits the serial byte stream into newline-terminated text frames
 *
 * Bytes are buffered until a '\n' arrives, so a frame may span any number of
 * chunks. Completed frames are trimmed, invalid UTF-8 is replaced with U+FFFD
 * and blank lines are dropped.
 */
class LineFramer {
public:
    // Append a chunk and return every frame it completed, in order
    std::vector<std::string> feed(const uint8_t* data, size_t size);
    std::vector<std::string> feed(const std::string& chunk);

    // Drop any partial frame
    void clear() { buffer_.clear(); }
    size_t pending() const { return buffer_.size(); }

    /**
     * @brief Terminal view of a raw chunk
     * Keeps printable ASCII plus \n, \r and \t. Reset garbage from the
     * ESP32 boot ROM (74880 baud) is mostly removed by this.
     */
    static std::string printable(const uint8_t* data, size_t size);

    // Replace malformed UTF-8 sequences with U+FFFD
    static std::string sanitizeUtf8(const std::string& text);

private:
    std::string buffer_;
};

} // namespace esplink

#endif // ESPLINK_LINE_FRAMER_HPP
