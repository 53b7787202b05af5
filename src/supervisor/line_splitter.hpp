#pragma once

#include <cstddef>
#include <string>
#include <vector>

/// Accumulates raw bytes from a pipe and yields complete lines in order.
/// Lines are returned without the trailing '\n' (or "\r\n").
class LineSplitter {
public:
    explicit LineSplitter(std::size_t max_line_bytes = 64 * 1024);

    /// Append a chunk; returns every line completed by it.
    std::vector<std::string> feed(const char* data, std::size_t size);

    /// End of stream: returns the unterminated remainder, if any.
    std::vector<std::string> finish();

    bool has_pending() const { return !pending_.empty(); }

private:
    std::size_t max_line_bytes_;
    std::string pending_;

    static void strip_cr(std::string& line);
};
