#include "supervisor/line_splitter.hpp"

LineSplitter::LineSplitter(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes == 0 ? 1 : max_line_bytes) {}

void LineSplitter::strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

std::vector<std::string> LineSplitter::feed(const char* data, std::size_t size) {
    std::vector<std::string> lines;

    for (std::size_t i = 0; i < size; ++i) {
        char c = data[i];
        if (c == '\n') {
            strip_cr(pending_);
            lines.push_back(std::move(pending_));
            pending_.clear();
            continue;
        }

        pending_ += c;

        // An engine that never prints a newline must not grow memory unbounded
        if (pending_.size() >= max_line_bytes_) {
            lines.push_back(std::move(pending_));
            pending_.clear();
        }
    }

    return lines;
}

std::vector<std::string> LineSplitter::finish() {
    std::vector<std::string> lines;
    if (!pending_.empty()) {
        strip_cr(pending_);
        lines.push_back(std::move(pending_));
        pending_.clear();
    }
    return lines;
}
