#include "ocipush/stream/chunked_transfer.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ocipush/stream/chunk_queue.hpp"

namespace ocipush::stream {

using namespace ocipush::core;

namespace {

[[nodiscard]] constexpr Status canceled_status() noexcept {
    return make_status(StatusDomain::Stream, StatusCode::Canceled);
}

// Holds the first error reported by either side of a transfer.
class ErrorSlot {
public:
    void offer(Status s) noexcept {
        std::lock_guard<std::mutex> lock(mu_);
        if (!set_) {
            set_ = true;
            status_ = s;
        }
    }

    [[nodiscard]] Status get_or(Status fallback) const noexcept {
        std::lock_guard<std::mutex> lock(mu_);
        return set_ ? status_ : fallback;
    }

private:
    mutable std::mutex mu_;
    Status status_{};
    bool set_{false};
};

// Fills one chunk with up to chunk_size bytes, looping over short reads.
Status read_chunk(ByteSource& source, u64 chunk_size, u64 first_byte, u64 part,
                  const std::stop_token& stop, Chunk* out, bool* eof) {
    const auto started = std::chrono::steady_clock::now();

    std::vector<u8> buffer(static_cast<size_t>(chunk_size));
    u64 filled = 0;
    while (filled < chunk_size) {
        if (stop.stop_requested()) {
            return canceled_status();
        }
        u64 n = 0;
        const Status s = source.read(buffer.data() + filled, chunk_size - filled, &n);
        if (!is_ok(s)) {
            return s;
        }
        if (n == 0) {
            *eof = true;
            break;
        }
        filled += n;
    }
    buffer.resize(static_cast<size_t>(filled));

    out->bytes = std::move(buffer);
    out->part = part;
    out->first_byte = first_byte;
    out->last_byte = filled > 0 ? first_byte + filled - 1 : first_byte;
    out->read_time = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    return ok_status();
}

class TransferSession {
public:
    TransferSession(ByteSource& source, const TransferOptions& opts) noexcept
        : source_(source), chunk_size_(opts.chunk_size), queue_(opts.queue_capacity) {}

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    Status run(const ChunkCallback& on_chunk, std::stop_token cancel, TransferStats* stats) noexcept {
        // Caller cancellation and internal aborts share one stop source. Any
        // stop also closes the source's read side so a blocked read returns.
        std::stop_callback link(cancel, [this] {
            error_.offer(canceled_status());
            stop_.request_stop();
        });
        std::stop_callback unblock(stop_.get_token(), [this] {
            source_.cancel(error_.get_or(canceled_status()));
        });

        Status s = start();
        if (is_ok(s)) {
            s = consume(on_chunk);
        }
        shutdown(!is_ok(s));

        if (stats != nullptr) {
            stats->chunks = chunks_;
            stats->bytes = delivered_;
            stats->last_byte = last_byte_;
            stats->max_queued = queue_.high_water();
            stats->discarded = discarded_;
            stats->producer_exited = producer_exited_.load(std::memory_order_acquire);
        }
        return s;
    }

    [[nodiscard]] u64 delivered() const noexcept { return delivered_; }

private:
    Status start() noexcept {
        try {
            producer_ = std::jthread([this] { produce(stop_.get_token()); });
        } catch (const std::system_error& e) {
            producer_exited_.store(true, std::memory_order_release);
            return make_status(StatusDomain::Stream, StatusCode::Unavailable, static_cast<u32>(e.code().value()));
        }
        return ok_status();
    }

    void produce(std::stop_token stop) noexcept {
        u64 next_byte = 0;
        u64 part = 1;
        bool eof = false;

        while (!eof && !stop.stop_requested()) {
            // Take a slot first so a chunk is only read once it has room.
            if (!queue_.reserve(stop)) {
                break;
            }

            Chunk chunk;
            Status s{};
            try {
                s = read_chunk(source_, chunk_size_, next_byte, part, stop, &chunk, &eof);
            } catch (const std::bad_alloc&) {
                s = make_status(StatusDomain::Stream, StatusCode::Unavailable);
            }
            if (!is_ok(s)) {
                queue_.unreserve();
                if (!stop.stop_requested()) {
                    error_.offer(s);
                    stop_.request_stop();
                }
                break;
            }
            if (chunk.bytes.empty()) {
                queue_.unreserve();
                continue;
            }

            const u64 size = chunk.size();
            bool queued = false;
            try {
                queued = queue_.push(std::move(chunk));
            } catch (const std::bad_alloc&) {
                queue_.unreserve();
                error_.offer(make_status(StatusDomain::Stream, StatusCode::Unavailable));
                stop_.request_stop();
            }
            if (!queued) {
                break;
            }
            next_byte += size;
            ++part;
        }

        queue_.close();
        producer_exited_.store(true, std::memory_order_release);
    }

    Status consume(const ChunkCallback& on_chunk) noexcept {
        const std::stop_token token = stop_.get_token();
        while (true) {
            Chunk chunk;
            const PopResult r = queue_.pop(&chunk, token);
            if (r == PopResult::Closed) {
                break;
            }
            if (r == PopResult::Stopped) {
                return error_.get_or(canceled_status());
            }

            const Status s = on_chunk(chunk);
            if (!is_ok(s)) {
                error_.offer(s);
                stop_.request_stop();
                return error_.get_or(s);
            }

            delivered_ += chunk.size();
            last_byte_ = static_cast<i64>(chunk.last_byte);
            ++chunks_;
        }
        return error_.get_or(ok_status());
    }

    // Stops the producer if it is still running, waits for it, and drops
    // whatever it queued that was never delivered.
    void shutdown(bool abort) noexcept {
        if (abort) {
            stop_.request_stop();
        }
        if (producer_.joinable()) {
            producer_.join();
        }
        discarded_ = queue_.drain();
        if (abort) {
            const Status reason = error_.get_or(canceled_status());
            spdlog::debug("chunked transfer aborted after {} chunks: {}/{} ({} queued chunks dropped)",
                          chunks_, status_domain_name(reason.domain), status_code_name(reason.code), discarded_);
        }
    }

    ByteSource& source_;
    const u64 chunk_size_;
    ChunkQueue queue_;
    ErrorSlot error_;
    std::stop_source stop_;
    std::atomic<bool> producer_exited_{false};
    std::jthread producer_;

    u64 delivered_{0};
    u64 chunks_{0};
    i64 last_byte_{-1};
    u32 discarded_{0};
};

} // namespace

Status chunked_transfer(ByteSource& source,
                        const TransferOptions& opts,
                        const ChunkCallback& on_chunk,
                        u64* bytes_out,
                        TransferStats* stats,
                        std::stop_token cancel) noexcept {
    if (bytes_out == nullptr || !on_chunk) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }
    *bytes_out = 0;
    if (opts.chunk_size == 0) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }

    TransferSession session(source, opts);
    const Status s = session.run(on_chunk, std::move(cancel), stats);
    if (is_ok(s)) {
        *bytes_out = session.delivered();
    }
    return s;
}

} // namespace ocipush::stream
