#include "ocipush/stream/chunk_queue.hpp"

#include <utility>

namespace ocipush::stream {

bool ChunkQueue::reserve(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mu_);
    const bool ready = not_full_.wait(lock, stop, [this] {
        return closed_ || items_.size() + reserved_ < capacity_;
    });
    if (!ready || closed_) {
        return false;
    }

    ++reserved_;
    const u32 in_use = static_cast<u32>(items_.size()) + reserved_;
    if (in_use > high_water_) {
        high_water_ = in_use;
    }
    return true;
}

void ChunkQueue::unreserve() noexcept {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (reserved_ > 0) {
            --reserved_;
        }
    }
    not_full_.notify_one();
}

bool ChunkQueue::push(Chunk&& chunk) {
    std::unique_lock<std::mutex> lock(mu_);
    if (closed_ || reserved_ == 0) {
        return false;
    }

    items_.push_back(std::move(chunk));
    --reserved_;
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

PopResult ChunkQueue::pop(Chunk* out, std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, stop, [this] { return closed_ || !items_.empty(); });
    if (stop.stop_requested()) {
        return PopResult::Stopped;
    }
    if (items_.empty()) {
        return PopResult::Closed;
    }

    *out = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return PopResult::Chunk;
}

void ChunkQueue::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

u32 ChunkQueue::drain() noexcept {
    u32 dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        dropped = static_cast<u32>(items_.size());
        items_.clear();
    }
    not_full_.notify_all();
    return dropped;
}

u32 ChunkQueue::size() const noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<u32>(items_.size());
}

u32 ChunkQueue::high_water() const noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    return high_water_;
}

} // namespace ocipush::stream
