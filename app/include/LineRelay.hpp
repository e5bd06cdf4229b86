#ifndef LINERELAY_HPP
#define LINERELAY_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Lazy sequence of text lines read from a file descriptor it does not own
class LineReader {
public:
    explicit LineReader(int fd, std::size_t chunk_size = 4096);

    /**
     * @brief Returns the next line without its terminator ("\n" or "\r\n").
     *
     * A final line without a terminator is still returned. Returns
     * std::nullopt once the descriptor reaches end of file.
     * @throws ErrorCodes::AppException OUTPUT_RELAY_FAILED on read errors.
     */
    std::optional<std::string> next_line();

private:
    bool fill_buffer();

    int fd_;
    std::vector<char> chunk_;
    std::string buffer_;
    std::size_t scan_from_{0};
    bool eof_{false};
};

/**
 * @brief Writes each line of reader to sink as soon as it is complete,
 *        flushing after every line.
 * @return Number of lines forwarded.
 */
std::size_t relay_lines(LineReader& reader, std::ostream& sink);

#endif // LINERELAY_HPP
