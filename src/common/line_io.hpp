#pragma once

#include <stop_token>
#include <string>
#include <string_view>

enum class ReadStatus { Ok, Eof, Error, Stopped, Timeout };

// Buffered reader for newline-delimited messages on a file descriptor.
// Does not own the descriptor.
class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    // Reads one line without its terminator. A trailing partial line at end of
    // stream is returned as a line. With a stoppable token or a timeout the wait
    // is done in short poll slices.
    ReadStatus read_line(std::string& line, std::stop_token stop = {}, int timeout_ms = -1);

    // errno of the last Error result.
    int last_error() const { return last_error_; }

private:
    bool take_line(std::string& line);

    int fd_;
    std::string buf_;
    bool eof_ = false;
    int last_error_ = 0;
};

// Writes `line` plus '\n', retrying short writes. Never raises SIGPIPE on sockets.
bool write_line(int fd, std::string_view line);
