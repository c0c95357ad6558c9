#include "ocipush/registry/status_tracker.hpp"

#include <utility>

namespace ocipush::registry {

using namespace ocipush::core;

const char* transfer_state_name(TransferState state) noexcept {
    switch (state) {
    case TransferState::Waiting: return "waiting";
    case TransferState::Resolving: return "resolving";
    case TransferState::Downloading: return "downloading";
    case TransferState::Uploading: return "uploading";
    case TransferState::Committing: return "committing";
    case TransferState::Done: return "done";
    case TransferState::Exists: return "exists";
    case TransferState::Failed: return "failed";
    }
    return "unknown";
}

void StatusTracker::set(const TransferStatus& status) {
    std::lock_guard<std::mutex> lock(mu_);
    records_[status.ref] = status;
}

Status StatusTracker::get(const std::string& ref, TransferStatus* out) const {
    if (out == nullptr) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(ref);
    if (it == records_.end()) {
        return make_status(StatusDomain::Registry, StatusCode::NotFound);
    }
    *out = it->second;
    return ok_status();
}

Status StatusTracker::set_state(const std::string& ref, TransferState state, Timestamp now) noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(ref);
    if (it == records_.end()) {
        return make_status(StatusDomain::Registry, StatusCode::NotFound);
    }
    it->second.state = state;
    it->second.updated_at = now;
    return ok_status();
}

Status StatusTracker::advance(const std::string& ref, u64 offset, Timestamp now) noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(ref);
    if (it == records_.end()) {
        return make_status(StatusDomain::Registry, StatusCode::NotFound);
    }
    if (offset > it->second.offset) {
        it->second.offset = offset;
    }
    it->second.updated_at = now;
    return ok_status();
}

void StatusTracker::erase(const std::string& ref) noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    records_.erase(ref);
}

std::vector<TransferStatus> StatusTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<TransferStatus> out;
    out.reserve(records_.size());
    for (const auto& [ref, status] : records_) {
        out.push_back(status);
    }
    return out;
}

void JobList::add(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!jobs_.insert(ref).second) {
        return;
    }
    ordered_.push_back(ref);
}

std::vector<TransferStatus> JobList::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<TransferStatus> out;
    out.reserve(ordered_.size());
    for (const std::string& ref : ordered_) {
        TransferStatus status;
        if (!is_ok(tracker_.get(ref, &status))) {
            status = TransferStatus{};
            status.ref = ref;
            status.state = TransferState::Waiting;
        }
        out.push_back(std::move(status));
    }
    return out;
}

size_t JobList::size() const noexcept {
    std::lock_guard<std::mutex> lock(mu_);
    return ordered_.size();
}

} // namespace ocipush::registry
