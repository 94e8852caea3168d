#include "chanvault/transport/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace chanvault::transport {

size_t read_full(ByteSource& source, uint8_t* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        size_t n = source.read(buf + total, len - total);
        if (n == 0) break;
        total += n;
    }
    return total;
}

size_t MemorySource::read(uint8_t* buf, size_t len) {
    size_t n = std::min(len, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

size_t StreamSource::read(uint8_t* buf, size_t len) {
    if (len == 0 || in_.eof()) return 0;
    in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    auto n = in_.gcount();
    if (in_.bad()) {
        throw std::runtime_error("stream read failed");
    }
    return static_cast<size_t>(n);
}

std::vector<uint8_t> read_all(ByteSource& source) {
    std::vector<uint8_t> out;
    uint8_t buf[64 * 1024];
    while (true) {
        size_t n = source.read(buf, sizeof(buf));
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    return out;
}

}  // namespace chanvault::transport
