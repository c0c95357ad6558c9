#include "ocipush/registry/layer_writer.hpp"

#include <new>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ocipush/stream/chunked_transfer.hpp"

namespace ocipush::registry {

using namespace ocipush::core;
using ocipush::digest::Digest;

namespace {

[[nodiscard]] constexpr Status registry_status(StatusCode code) noexcept {
    return make_status(StatusDomain::Registry, code);
}

} // namespace

LayerWriter::LayerWriter() noexcept = default;

LayerWriter::~LayerWriter() noexcept {
    if (phase_ == Phase::Open) {
        abort();
    }
}

Status LayerWriter::open(ImageStore& store,
                         const Repository& repo,
                         const Descriptor& desc,
                         StatusTracker& tracker,
                         const UploadConfig& cfg) noexcept {
    if (phase_ != Phase::Idle) {
        return registry_status(StatusCode::Invalid);
    }
    if (desc.digest.empty()) {
        return registry_status(StatusCode::Invalid);
    }

    UploadSession session;
    Status s = store.initiate_upload(repo, &session);
    if (!is_ok(s)) {
        spdlog::debug("initiate upload for {} failed: {}", desc.digest.str(), status_code_name(s.code));
        return s;
    }
    if (session.upload_id.empty() || session.part_size == 0) {
        return registry_status(StatusCode::Invalid);
    }

    try {
        pipe_ = std::make_unique<ocipush::stream::BytePipe>(cfg.pipe_capacity);
        store_ = &store;
        tracker_ = &tracker;
        repo_ = repo;
        ref_ = make_ref_key(desc);
        cfg_ = cfg;
        session_ = std::move(session);

        digesting_ = false;
        if (cfg.verify_content) {
            const Status ds = digester_.init(desc.digest.algorithm);
            digesting_ = is_ok(ds);
            if (!digesting_) {
                spdlog::debug("local verification off for {}: {}", ref_, status_code_name(ds.code));
            }
        }

        const Timestamp now = now_millis();
        TransferStatus record;
        record.ref = ref_;
        record.state = TransferState::Uploading;
        record.total = desc.size;
        record.started_at = now;
        record.updated_at = now;
        record.upload_id = session_.upload_id;
        tracker.set(record);

        worker_ = std::jthread([this](std::stop_token stop) { run_transfer(std::move(stop)); });
    } catch (const std::bad_alloc&) {
        return registry_status(StatusCode::Unavailable);
    } catch (const std::system_error& e) {
        return make_status(StatusDomain::Registry, StatusCode::Unavailable, static_cast<u32>(e.code().value()));
    }

    phase_ = Phase::Open;
    spdlog::debug("layer upload started: ref={} upload_id={} part_size={}", ref_, session_.upload_id,
                  session_.part_size);
    return ok_status();
}

void LayerWriter::run_transfer(std::stop_token stop) noexcept {
    ocipush::stream::TransferOptions opts;
    opts.chunk_size = session_.part_size;
    opts.queue_capacity = cfg_.queue_capacity;

    u64 bytes = 0;
    ocipush::stream::TransferStats stats;
    const Status s = ocipush::stream::chunked_transfer(
        pipe_->reader(), opts,
        [this](const ocipush::stream::Chunk& chunk) { return upload_chunk(chunk); },
        &bytes, &stats, std::move(stop));

    if (is_ok(s)) {
        spdlog::debug("layer {} transferred {} bytes in {} parts", ref_, bytes, stats.chunks);
    } else {
        spdlog::debug("layer {} transfer failed after {} parts: {}/{}", ref_, stats.chunks,
                      status_domain_name(s.domain), status_code_name(s.code));
        mark(TransferState::Failed);
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        done_ = true;
        result_ = s;
        transferred_ = bytes;
    }
    done_cv_.notify_all();
}

Status LayerWriter::upload_chunk(const ocipush::stream::Chunk& chunk) noexcept {
    const Status s = store_->upload_part(repo_, session_.upload_id, chunk.range(), chunk.view());
    if (!is_ok(s)) {
        spdlog::debug("upload part {} of {} failed: {}", chunk.part, ref_, status_code_name(s.code));
        return s;
    }
    spdlog::trace("uploaded part {} of {} bytes [{}, {}]", chunk.part, ref_, chunk.first_byte, chunk.last_byte);

    const Status ts = tracker_->advance(ref_, chunk.last_byte + 1, now_millis());
    if (!is_ok(ts)) {
        spdlog::debug("no status record for {}", ref_);
    }
    return ok_status();
}

Status LayerWriter::write(BufferView data, u64* written) noexcept {
    if (written == nullptr || !buffer_ok(data)) {
        return registry_status(StatusCode::Invalid);
    }
    *written = 0;
    if (phase_ != Phase::Open) {
        return registry_status(StatusCode::Invalid);
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (done_ && !is_ok(result_)) {
            return result_;
        }
    }
    if (worker_.get_stop_token().stop_requested()) {
        return registry_status(StatusCode::Canceled);
    }
    if (data.len == 0) {
        return ok_status();
    }

    if (digesting_) {
        const Status ds = digester_.update(data);
        if (!is_ok(ds)) {
            return ds;
        }
    }
    return pipe_->write(data, written);
}

Status LayerWriter::commit(u64 expected_size, const Digest& expected, std::stop_token cancel) noexcept {
    if (phase_ != Phase::Open || expected.empty()) {
        return registry_status(StatusCode::Invalid);
    }

    mark(TransferState::Committing);
    pipe_->close_write();

    Status result{};
    {
        std::unique_lock<std::mutex> lock(mu_);
        const bool finished = done_cv_.wait(lock, cancel, [this] { return done_; });
        if (!finished) {
            lock.unlock();
            spdlog::debug("commit of {} canceled", ref_);
            abort();
            return registry_status(StatusCode::Canceled);
        }
        result = result_;
    }

    phase_ = Phase::Closed;
    if (worker_.joinable()) {
        worker_.join();
    }
    if (!is_ok(result)) {
        mark(TransferState::Failed);
        return result;
    }
    const Status cs = complete(expected_size, expected);
    if (!is_ok(cs)) {
        mark(TransferState::Failed);
    }
    return cs;
}

Status LayerWriter::complete(u64 expected_size, const Digest& expected) noexcept {
    if (expected_size != 0 && expected_size != transferred_) {
        spdlog::debug("layer {} size mismatch: expected {} wrote {}", ref_, expected_size, transferred_);
        return registry_status(StatusCode::Invalid);
    }

    if (digesting_ && digester_.algorithm() == expected.algorithm) {
        Digest local;
        const Status ds = digester_.finish(&local);
        if (!is_ok(ds)) {
            return ds;
        }
        if (local != expected) {
            spdlog::debug("layer {} content digest {} does not match {}", ref_, local.str(), expected.str());
            return make_status(StatusDomain::Digest, StatusCode::Corrupt);
        }
    }

    Digest actual;
    Status s{};
    try {
        const std::vector<Digest> digests{expected};
        s = store_->complete_upload(repo_, session_.upload_id, digests, &actual);
    } catch (const std::bad_alloc&) {
        return registry_status(StatusCode::Unavailable);
    }

    if (s.code == StatusCode::AlreadyExists) {
        if (expected.algorithm != store_->validated_algorithm()) {
            return s;
        }
        spdlog::debug("layer {} already exists", ref_);
        mark(TransferState::Exists);
        return ok_status();
    }
    if (!is_ok(s)) {
        spdlog::debug("complete upload of {} failed: {}", ref_, status_code_name(s.code));
        return s;
    }
    if (actual != expected) {
        spdlog::debug("layer {} stored as {}, expected {}", ref_, actual.str(), expected.str());
        return registry_status(StatusCode::Corrupt);
    }

    mark(TransferState::Done);
    spdlog::debug("layer {} committed ({} bytes)", ref_, transferred_);
    return ok_status();
}

Status LayerWriter::status(TransferStatus* out) const {
    if (out == nullptr || tracker_ == nullptr) {
        return registry_status(StatusCode::Invalid);
    }
    return tracker_->get(ref_, out);
}

Status LayerWriter::close() noexcept {
    return registry_status(StatusCode::Unsupported);
}

Status LayerWriter::truncate(u64 size) noexcept {
    (void)size;
    return registry_status(StatusCode::Unsupported);
}

void LayerWriter::abort() noexcept {
    if (phase_ == Phase::Idle) {
        return;
    }
    const bool was_open = phase_ == Phase::Open;
    phase_ = Phase::Closed;
    worker_.request_stop();
    if (pipe_) {
        pipe_->close_read(registry_status(StatusCode::Canceled));
        pipe_->close_write(registry_status(StatusCode::Canceled));
    }
    if (was_open) {
        mark(TransferState::Failed);
    }
    spdlog::debug("layer upload {} aborted", ref_);
}

void LayerWriter::mark(TransferState state) noexcept {
    const Status ts = tracker_->set_state(ref_, state, now_millis());
    if (!is_ok(ts)) {
        spdlog::debug("no status record for {}", ref_);
    }
}

} // namespace ocipush::registry
