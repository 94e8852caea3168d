#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace chanvault::transport {

// Pull-based byte stream. Parts are streamed through these so a part never
// has to be held in memory as a whole.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read up to len bytes into buf. Returns 0 at end of stream.
    // Throws std::runtime_error on I/O or integrity failures.
    virtual size_t read(uint8_t* buf, size_t len) = 0;
};

// Keep reading until len bytes arrived or the stream ended.
size_t read_full(ByteSource& source, uint8_t* buf, size_t len);

// Source over an in-memory buffer (not owned)
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::span<const uint8_t> data) : data_(data) {}

    size_t read(uint8_t* buf, size_t len) override;

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

// Source over a std::istream (file or stdin)
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}

    size_t read(uint8_t* buf, size_t len) override;

private:
    std::istream& in_;
};

// Drain a source into a vector (tests and small reads only)
std::vector<uint8_t> read_all(ByteSource& source);

}  // namespace chanvault::transport
