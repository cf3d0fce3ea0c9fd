/*
 * sandcell - Output Buffer Implementation
 */
#include <sandcell/sandbox/output_buffer.hpp>

namespace sandcell {

OutputBuffer::OutputBuffer(size_t limit)
    : limit_(limit)
    , dropped_(0)
{
}

void OutputBuffer::append(const char* data, size_t len) {
    size_t room = data_.size() < limit_ ? limit_ - data_.size() : 0;
    size_t take = len < room ? len : room;
    data_.append(data, take);
    dropped_ += len - take;
}

std::string OutputBuffer::str() const {
    if (dropped_ == 0) return data_;

    // Drop a multi-byte sequence cut by the limit
    size_t end = data_.size();
    size_t lead = end;
    while (lead > 0 && end - lead < 4 &&
           (static_cast<unsigned char>(data_[lead - 1]) & 0xC0) == 0x80) {
        --lead;
    }
    if (lead > 0) {
        unsigned char c = static_cast<unsigned char>(data_[lead - 1]);
        size_t need = c >= 0xF0 ? 4 : c >= 0xE0 ? 3 : c >= 0xC0 ? 2 : 1;
        if (end - (lead - 1) < need) end = lead - 1;
    }
    size_t back = data_.size() - end;
    return data_.substr(0, end) + truncation_marker(dropped_ + back);
}

std::string OutputBuffer::tail(size_t max_len) const {
    if (data_.size() <= max_len) return data_;
    return data_.substr(data_.size() - max_len);
}

std::string truncation_marker(size_t dropped) {
    return "\n[output truncated: " + std::to_string(dropped) + " bytes omitted]\n";
}

} // namespace sandcell
