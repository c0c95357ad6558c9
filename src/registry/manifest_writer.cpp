#include "ocipush/registry/manifest_writer.hpp"

#include <new>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ocipush::registry {

using namespace ocipush::core;
using ocipush::digest::Digest;

Status ManifestWriter::open(ImageStore& store,
                            const Repository& repo,
                            const std::string& tag,
                            const Descriptor& desc,
                            StatusTracker& tracker) noexcept {
    if (open_ || desc.digest.empty()) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    try {
        repo_ = repo;
        tag_ = tag;
        ref_ = make_ref_key(desc);
        buf_.clear();

        const Timestamp now = now_millis();
        TransferStatus record;
        record.ref = ref_;
        record.state = TransferState::Uploading;
        record.total = desc.size;
        record.started_at = now;
        record.updated_at = now;
        tracker.set(record);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Registry, StatusCode::Unavailable);
    }

    store_ = &store;
    tracker_ = &tracker;
    open_ = true;
    return ok_status();
}

Status ManifestWriter::write(BufferView data, u64* written) noexcept {
    if (written == nullptr || !buffer_ok(data)) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }
    *written = 0;
    if (!open_) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }
    try {
        buf_.append(reinterpret_cast<const char*>(data.data), static_cast<size_t>(data.len));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Registry, StatusCode::Unavailable);
    }
    *written = data.len;

    const Status ts = tracker_->advance(ref_, buffered(), now_millis());
    if (!is_ok(ts)) {
        spdlog::debug("no status record for {}", ref_);
    }
    return ok_status();
}

Status ManifestWriter::commit(u64 expected_size, const Digest& expected) noexcept {
    if (!open_ || expected.empty()) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }
    if (expected_size != 0 && expected_size != buffered()) {
        spdlog::debug("manifest {} size mismatch: expected {} buffered {}", ref_, expected_size, buffered());
        mark(TransferState::Failed);
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    mark(TransferState::Committing);

    Digest actual;
    const Status s = store_->put_manifest(repo_, tag_, std::string_view(buf_), &actual);
    if (!is_ok(s)) {
        spdlog::debug("put manifest {} ({}:{}) failed: {}", ref_, repo_.name, tag_, status_code_name(s.code));
        mark(TransferState::Failed);
        return s;
    }
    if (actual != expected) {
        spdlog::debug("manifest {} stored as {}, expected {}", ref_, actual.str(), expected.str());
        mark(TransferState::Failed);
        return make_status(StatusDomain::Registry, StatusCode::Corrupt);
    }

    open_ = false;
    mark(TransferState::Done);
    spdlog::debug("manifest {} committed to {}", ref_, repo_.name);
    return ok_status();
}

void ManifestWriter::mark(TransferState state) noexcept {
    const Status ts = tracker_->set_state(ref_, state, now_millis());
    if (!is_ok(ts)) {
        spdlog::debug("no status record for {}", ref_);
    }
}

Status ManifestWriter::status(TransferStatus* out) const {
    if (out == nullptr || tracker_ == nullptr) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }
    return tracker_->get(ref_, out);
}

Status ManifestWriter::close() noexcept {
    return make_status(StatusDomain::Registry, StatusCode::Unsupported);
}

Status ManifestWriter::truncate(u64 size) noexcept {
    (void)size;
    return make_status(StatusDomain::Registry, StatusCode::Unsupported);
}

} // namespace ocipush::registry
