#ifndef sandcell_SANDBOX_OUTPUT_BUFFER_HPP
#define sandcell_SANDBOX_OUTPUT_BUFFER_HPP

#include <string>
#include <cstddef>

namespace sandcell {

// Bounded capture of one output stream. Keeps the first `limit` bytes and
// counts the rest; str() appends a truncation marker when bytes were dropped.
class OutputBuffer {
public:
    explicit OutputBuffer(size_t limit);

    void append(const char* data, size_t len);
    void append(const std::string& data) { append(data.data(), data.size()); }

    bool truncated() const { return dropped_ > 0; }
    size_t dropped_bytes() const { return dropped_; }
    size_t size() const { return data_.size(); }
    size_t limit() const { return limit_; }

    // Captured text plus the marker, never splitting a UTF-8 sequence
    std::string str() const;

    // Last `max_len` captured bytes (for launcher diagnostics)
    std::string tail(size_t max_len) const;

private:
    std::string data_;
    size_t limit_;
    size_t dropped_;
};

// "\n[output truncated: N bytes omitted]\n"
std::string truncation_marker(size_t dropped);

} // namespace sandcell

#endif // sandcell_SANDBOX_OUTPUT_BUFFER_HPP
