#include "LineRelay.hpp"
#include "AppException.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

LineReader::LineReader(int fd, std::size_t chunk_size)
    : fd_(fd),
      chunk_(chunk_size == 0 ? 1 : chunk_size)
{
}


std::optional<std::string> LineReader::next_line()
{
    while (true) {
        const auto newline = buffer_.find('\n', scan_from_);
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            scan_from_ = 0;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        scan_from_ = buffer_.size();

        if (eof_ || !fill_buffer()) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string line;
            line.swap(buffer_);
            scan_from_ = 0;
            if (line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
    }
}


bool LineReader::fill_buffer()
{
    ssize_t received;
    do {
        received = ::read(fd_, chunk_.data(), chunk_.size());
    } while (received == -1 && errno == EINTR);

    if (received < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::OUTPUT_RELAY_FAILED,
                        "fd " + std::to_string(fd_) + ": " + std::strerror(errno));
    }
    if (received == 0) {
        eof_ = true;
        return false;
    }
    buffer_.append(chunk_.data(), static_cast<std::size_t>(received));
    return true;
}


std::size_t relay_lines(LineReader& reader, std::ostream& sink)
{
    std::size_t forwarded = 0;
    while (auto line = reader.next_line()) {
        sink << *line << '\n' << std::flush;
        ++forwarded;
    }
    return forwarded;
}
