#include "ocipush/stream/byte_pipe.hpp"

#include <algorithm>
#include <cstring>

namespace ocipush::stream {

using namespace ocipush::core;

BytePipe::BytePipe(u64 capacity) : ring_(static_cast<size_t>(capacity == 0 ? 1 : capacity)) {}

u64 BytePipe::buffered() const noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    return size_;
}

Status BytePipe::write(BufferView data, u64* written) noexcept {
    if (written == nullptr || !buffer_ok(data)) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }
    *written = 0;

    const u64 cap = static_cast<u64>(ring_.size());
    std::unique_lock<std::mutex> lock(mu_);

    u64 done = 0;
    while (true) {
        if (read_closed_) {
            *written = done;
            return read_reason_;
        }
        if (write_closed_) {
            *written = done;
            return make_status(StatusDomain::Stream, StatusCode::Invalid);
        }
        if (done == data.len) {
            break;
        }

        writable_.wait(lock, [&] { return read_closed_ || write_closed_ || size_ < cap; });
        if (read_closed_ || write_closed_) {
            continue;
        }

        // Copy into the free region, wrapping at the end of the ring.
        u64 tail = (head_ + size_) % cap;
        u64 space = cap - size_;
        u64 take = std::min(space, data.len - done);
        while (take > 0) {
            const u64 run = std::min(take, cap - tail);
            std::memcpy(ring_.data() + tail, data.data + done, static_cast<size_t>(run));
            done += run;
            size_ += run;
            take -= run;
            tail = (tail + run) % cap;
        }
        readable_.notify_one();
    }

    *written = done;
    return ok_status();
}

Status BytePipe::read(u8* dst, u64 cap, u64* n) noexcept {
    if (n == nullptr || (cap > 0 && dst == nullptr)) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }
    *n = 0;

    const u64 ring_cap = static_cast<u64>(ring_.size());
    std::unique_lock<std::mutex> lock(mu_);
    readable_.wait(lock, [&] { return size_ > 0 || write_closed_ || read_closed_; });

    if (read_closed_) {
        return read_reason_;
    }
    if (size_ == 0) {
        return write_reason_;
    }

    u64 take = std::min(cap, size_);
    u64 copied = 0;
    while (take > 0) {
        const u64 run = std::min(take, ring_cap - head_);
        std::memcpy(dst + copied, ring_.data() + head_, static_cast<size_t>(run));
        copied += run;
        head_ = (head_ + run) % ring_cap;
        size_ -= run;
        take -= run;
    }
    if (size_ == 0) {
        head_ = 0;
    }

    *n = copied;
    writable_.notify_one();
    return ok_status();
}

void BytePipe::close_write() noexcept {
    close_write(ok_status());
}

void BytePipe::close_write(Status reason) noexcept {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (write_closed_) {
            return;
        }
        write_closed_ = true;
        write_reason_ = reason;
    }
    readable_.notify_all();
    writable_.notify_all();
}

void BytePipe::close_read(Status reason) noexcept {
    if (is_ok(reason)) {
        reason = make_status(StatusDomain::Stream, StatusCode::Canceled);
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (read_closed_) {
            return;
        }
        read_closed_ = true;
        read_reason_ = reason;
    }
    readable_.notify_all();
    writable_.notify_all();
}

} // namespace ocipush::stream
