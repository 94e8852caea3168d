#include "chanvault/transport/uploader.hpp"
#include "chanvault/core/log.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <mutex>
#include <random>
#include <system_error>
#include <thread>
#include <vector>

namespace chanvault::transport {

namespace {

int64_t random_file_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dist(1, std::numeric_limits<int64_t>::max());
    return dist(rng);
}

}  // namespace

Uploader::Uploader(Transport& transport, UploaderOptions options, CancelFlag cancel)
    : transport_(transport)
    , options_(options)
    , cancel_(std::move(cancel)) {
    if (options_.threads == 0) options_.threads = 1;
    if (options_.part_size == 0) options_.part_size = 512 * 1024;
}

int Uploader::part_count(uint64_t size, size_t part_size) {
    if (size == 0) return 1;
    return static_cast<int>((size + part_size - 1) / part_size);
}

UploadedFile Uploader::upload(ByteSource& source, uint64_t size) {
    UploadedFile result;
    result.file_id = random_file_id();
    result.total_parts = part_count(size, options_.part_size);

    std::mutex mutex;  // Guards source, next_part, bytes_read and first_error
    int next_part = 0;
    uint64_t bytes_read = 0;
    CallStatus first_error;
    bool failed = false;
    bool source_error = false;

    auto fail = [&](CallStatus status) {
        std::lock_guard lock(mutex);
        if (!failed) {
            failed = true;
            first_error = std::move(status);
        }
    };

    auto worker = [&]() {
        std::vector<uint8_t> buffer(options_.part_size);
        while (true) {
            int part = 0;
            size_t len = 0;
            {
                std::lock_guard lock(mutex);
                if (failed || next_part >= result.total_parts) return;
                if (cancel_.cancelled()) {
                    failed = true;
                    first_error = CallStatus::failure(ErrorKind::Cancelled, "request cancelled");
                    return;
                }
                part = next_part++;
                size_t want = static_cast<size_t>(
                    std::min<uint64_t>(options_.part_size, size - bytes_read));
                try {
                    len = read_full(source, buffer.data(), want);
                } catch (const std::exception& e) {
                    failed = true;
                    source_error = true;
                    first_error = CallStatus::failure(ErrorKind::Fatal,
                                                      std::string("read failed: ") + e.what());
                    return;
                }
                if (len != want) {
                    failed = true;
                    source_error = true;
                    first_error = CallStatus::failure(
                        ErrorKind::Fatal, "stream ended after " +
                        std::to_string(bytes_read + len) + " of " + std::to_string(size) + " bytes");
                    return;
                }
                bytes_read += len;
            }

            auto status = transport_.save_file_part(
                result.file_id, part, result.total_parts,
                std::span<const uint8_t>(buffer.data(), len));
            if (!status.ok()) {
                log_error("upload of part %d/%d failed: %s",
                          part + 1, result.total_parts, status.error_message.c_str());
                fail(std::move(status));
                return;
            }
        }
    };

    size_t thread_count = std::min<size_t>(options_.threads,
                                           static_cast<size_t>(result.total_parts));
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    try {
        for (size_t i = 0; i < thread_count; ++i) {
            threads.push_back(start_thread_ ? start_thread_(worker) : std::thread(worker));
        }
    } catch (const std::system_error& e) {
        // Workers already running see the failure and stop at their next part
        log_error("cannot start upload thread: %s", e.what());
        fail(CallStatus::failure(ErrorKind::Fatal,
                                 std::string("cannot start upload thread: ") + e.what()));
    }
    for (auto& t : threads) {
        t.join();
    }

    if (failed) {
        result.status = first_error;
        result.source_error = source_error;
        return result;
    }

    // The declared size must cover the whole stream
    uint8_t extra = 0;
    try {
        if (source.read(&extra, 1) != 0) {
            result.source_error = true;
            result.status = CallStatus::failure(ErrorKind::Fatal,
                                                "stream is longer than " + std::to_string(size) + " bytes");
            return result;
        }
    } catch (const std::exception& e) {
        result.source_error = true;
        result.status = CallStatus::failure(ErrorKind::Fatal, std::string("read failed: ") + e.what());
        return result;
    }

    result.bytes = bytes_read;
    return result;
}

}  // namespace chanvault::transport
