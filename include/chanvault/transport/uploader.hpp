#pragma once

#include "chanvault/core/cancel.hpp"
#include "chanvault/transport/byte_source.hpp"
#include "chanvault/transport/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

namespace chanvault::transport {

struct UploaderOptions {
    size_t threads = 8;
    size_t part_size = 512 * 1024;
};

// File parts pushed to the transport, ready to be attached to a message
struct UploadedFile {
    CallStatus status;
    int64_t file_id = 0;
    int total_parts = 0;
    uint64_t bytes = 0;
    bool source_error = false;  // The failure came from reading the source
};

/// Splits a stream into fixed-size file parts and uploads them with a
/// number of worker threads. The source is read sequentially, so at most
/// threads * part_size bytes are buffered at once.
class Uploader {
public:
    Uploader(Transport& transport, UploaderOptions options, CancelFlag cancel);

    /// Upload exactly size bytes from source.
    /// Fails if the stream is shorter or longer than size.
    UploadedFile upload(ByteSource& source, uint64_t size);

    static int part_count(uint64_t size, size_t part_size);

    /// Replace how worker threads are started (tests)
    using ThreadStarter = std::function<std::thread(std::function<void()>)>;
    void set_thread_starter(ThreadStarter starter) { start_thread_ = std::move(starter); }

private:
    Transport& transport_;
    UploaderOptions options_;
    CancelFlag cancel_;
    ThreadStarter start_thread_;
};

}  // namespace chanvault::transport
