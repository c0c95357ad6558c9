#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fake_image_store.hpp"
#include "ocipush/registry/layer_writer.hpp"

using namespace ocipush::registry;
using ocipush::core::BufferView;
using ocipush::core::ByteRange;
using ocipush::core::Status;
using ocipush::core::StatusCode;
using ocipush::core::StatusDomain;
using ocipush::digest::Digest;
using ocipush::digest::DigestAlgorithm;
using ocipush::testing::FakeImageStore;

namespace {

BufferView view_of(const std::string& s) {
    return BufferView{reinterpret_cast<const ocipush::core::u8*>(s.data()), static_cast<u64>(s.size())};
}

Digest digest_of(const std::string& data, DigestAlgorithm alg = DigestAlgorithm::Sha256) {
    Digest d;
    EXPECT_EQ(ocipush::digest::digest_compute(alg, view_of(data), &d).code, StatusCode::Ok);
    return d;
}

Descriptor layer_desc(const std::string& data, DigestAlgorithm alg = DigestAlgorithm::Sha256) {
    Descriptor d;
    d.media_type = std::string(kMediaTypeOciLayerGzip);
    d.digest = digest_of(data, alg);
    d.size = data.size();
    return d;
}

} // namespace

class LayerWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_.registry = "registry";
        repo_.name = "repository";
    }

    Repository repo_;
    FakeImageStore store_;
    StatusTracker tracker_;
};

TEST_F(LayerWriterTest, UploadsEveryByteAsItsOwnPart) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);

    std::mutex mu;
    std::string uploaded;
    std::vector<ByteRange> ranges;
    store_.upload_part_fn = [&](const Repository& repo, const std::string& upload_id, ByteRange range,
                                BufferView part) {
        EXPECT_EQ(repo.registry, "registry");
        EXPECT_EQ(repo.name, "repository");
        EXPECT_EQ(upload_id, "upload");
        EXPECT_EQ(part.len, 1u);
        std::lock_guard<std::mutex> lock(mu);
        uploaded.append(reinterpret_cast<const char*>(part.data), part.len);
        ranges.push_back(range);
        return ocipush::core::ok_status();
    };
    store_.complete_fn = [&](const Repository&, const std::string& upload_id, const std::vector<Digest>& digests,
                             Digest* actual) {
        EXPECT_EQ(upload_id, "upload");
        EXPECT_EQ(store_.upload_part_calls.load(), static_cast<int>(data.size()));
        EXPECT_EQ(digests.size(), 1u);
        *actual = digests.front();
        return ocipush::core::ok_status();
    };

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    EXPECT_EQ(store_.initiate_calls.load(), 1);
    EXPECT_EQ(store_.complete_calls.load(), 0);
    EXPECT_EQ(lw.upload_id(), "upload");
    EXPECT_EQ(lw.part_size(), 1u);

    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(data), &written).code, StatusCode::Ok);
    EXPECT_EQ(written, data.size());

    ASSERT_EQ(lw.commit(data.size(), desc.digest).code, StatusCode::Ok);
    EXPECT_EQ(store_.complete_calls.load(), 1);
    EXPECT_EQ(uploaded, data);
    ASSERT_EQ(ranges.size(), data.size());
    for (size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].first, i);
        EXPECT_EQ(ranges[i].last, i);
    }

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.ref, "layer-" + desc.digest.str());
    EXPECT_EQ(st.state, TransferState::Done);
    EXPECT_EQ(st.offset, data.size());
    EXPECT_EQ(st.total, data.size());
    EXPECT_EQ(st.upload_id, "upload");
}

TEST_F(LayerWriterTest, LargerPartsAndSmallPipe) {
    std::string data(10000, '\0');
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>('a' + (i % 26));
    }
    const Descriptor desc = layer_desc(data);

    store_.initiate_fn = [](const Repository&, UploadSession* out) {
        out->upload_id = "u-1";
        out->part_size = 1024;
        return ocipush::core::ok_status();
    };
    std::string uploaded;
    store_.upload_part_fn = [&](const Repository&, const std::string&, ByteRange range, BufferView part) {
        EXPECT_EQ(range.first, uploaded.size());
        EXPECT_EQ(range.length(), part.len);
        uploaded.append(reinterpret_cast<const char*>(part.data), part.len);
        return ocipush::core::ok_status();
    };

    ocipush::core::UploadConfig cfg;
    cfg.pipe_capacity = 100;
    cfg.queue_capacity = 2;

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_, cfg).code, StatusCode::Ok);
    for (size_t off = 0; off < data.size(); off += 777) {
        const std::string piece = data.substr(off, 777);
        u64 written = 0;
        ASSERT_EQ(lw.write(view_of(piece), &written).code, StatusCode::Ok);
        EXPECT_EQ(written, piece.size());
    }
    ASSERT_EQ(lw.commit(0, desc.digest).code, StatusCode::Ok);
    EXPECT_EQ(uploaded, data);
    EXPECT_EQ(store_.upload_part_calls.load(), 10);
}

TEST_F(LayerWriterTest, AlreadyExistsIsSuccessForValidatedAlgorithm) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);
    store_.complete_fn = [](const Repository&, const std::string&, const std::vector<Digest>&, Digest*) {
        return ocipush::core::make_status(StatusDomain::Registry, StatusCode::AlreadyExists);
    };

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(data), &written).code, StatusCode::Ok);
    EXPECT_EQ(lw.commit(0, desc.digest).code, StatusCode::Ok);
    EXPECT_EQ(store_.complete_calls.load(), 1);

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.state, TransferState::Exists);
}

TEST_F(LayerWriterTest, AlreadyExistsWithoutWritesIsSuccess) {
    const std::string data;
    const Descriptor desc = layer_desc(data);
    store_.complete_fn = [](const Repository&, const std::string&, const std::vector<Digest>&, Digest*) {
        return ocipush::core::make_status(StatusDomain::Registry, StatusCode::AlreadyExists);
    };

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    EXPECT_EQ(lw.commit(0, desc.digest).code, StatusCode::Ok);
    EXPECT_EQ(store_.upload_part_calls.load(), 0);
    EXPECT_EQ(store_.complete_calls.load(), 1);
}

TEST_F(LayerWriterTest, AlreadyExistsIsErrorForOtherAlgorithm) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data, DigestAlgorithm::Sha512);
    store_.complete_fn = [](const Repository&, const std::string&, const std::vector<Digest>&, Digest*) {
        return ocipush::core::make_status(StatusDomain::Registry, StatusCode::AlreadyExists);
    };

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(data), &written).code, StatusCode::Ok);
    EXPECT_EQ(lw.commit(0, desc.digest).code, StatusCode::AlreadyExists);

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.state, TransferState::Failed);
}

TEST_F(LayerWriterTest, StoreDigestMismatchIsCorrupt) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);
    store_.complete_fn = [](const Repository&, const std::string&, const std::vector<Digest>&, Digest* actual) {
        *actual = Digest{DigestAlgorithm::Sha256, std::string(64, '0')};
        return ocipush::core::ok_status();
    };

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(data), &written).code, StatusCode::Ok);
    const Status s = lw.commit(0, desc.digest);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(s.domain, StatusDomain::Registry);

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.state, TransferState::Failed);
}

TEST_F(LayerWriterTest, LocalDigestMismatchIsCorrupt) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    const std::string other = "LAYER";
    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(other), &written).code, StatusCode::Ok);
    const Status s = lw.commit(0, desc.digest);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(s.domain, StatusDomain::Digest);
    EXPECT_EQ(store_.complete_calls.load(), 0);
}

TEST_F(LayerWriterTest, VerificationOffDefersToStore) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);
    ocipush::core::UploadConfig cfg;
    cfg.verify_content = false;

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_, cfg).code, StatusCode::Ok);
    const std::string other = "LAYER";
    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(other), &written).code, StatusCode::Ok);
    EXPECT_EQ(lw.commit(0, desc.digest).code, StatusCode::Ok);
    EXPECT_EQ(store_.complete_calls.load(), 1);
}

TEST_F(LayerWriterTest, SizeMismatchIsInvalid) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    u64 written = 0;
    ASSERT_EQ(lw.write(view_of(data), &written).code, StatusCode::Ok);
    EXPECT_EQ(lw.commit(data.size() + 1, desc.digest).code, StatusCode::Invalid);
    EXPECT_EQ(store_.complete_calls.load(), 0);

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.state, TransferState::Failed);
}

TEST_F(LayerWriterTest, PartFailureSurfacesOnCommit) {
    const std::string data = "layer";
    const Descriptor desc = layer_desc(data);
    const Status boom = ocipush::core::make_status(StatusDomain::Registry, StatusCode::Network, 503);
    store_.upload_part_fn = [&](const Repository&, const std::string&, ByteRange range, BufferView) {
        return range.first == 2 ? boom : ocipush::core::ok_status();
    };

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    u64 written = 0;
    const Status ws = lw.write(view_of(data), &written);
    EXPECT_TRUE(ws.code == StatusCode::Ok || ws == boom);

    EXPECT_EQ(lw.commit(0, desc.digest), boom);
    EXPECT_EQ(store_.upload_part_calls.load(), 3);
    EXPECT_EQ(store_.complete_calls.load(), 0);

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.state, TransferState::Failed);
    EXPECT_EQ(st.offset, 2u);
}

TEST_F(LayerWriterTest, WriteFailsFastAfterPartFailure) {
    const Descriptor desc = layer_desc("whatever");
    const Status boom = ocipush::core::make_status(StatusDomain::Registry, StatusCode::Network, 500);
    store_.upload_part_fn = [&](const Repository&, const std::string&, ByteRange, BufferView) { return boom; };

    ocipush::core::UploadConfig cfg;
    cfg.pipe_capacity = 4;
    cfg.queue_capacity = 1;

    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_, cfg).code, StatusCode::Ok);

    // Keep writing until the background failure reaches the writer.
    const std::string block(64, 'x');
    Status ws{};
    for (int i = 0; i < 1000 && ocipush::core::is_ok(ws); ++i) {
        u64 written = 0;
        ws = lw.write(view_of(block), &written);
    }
    EXPECT_EQ(ws, boom);
    EXPECT_EQ(store_.upload_part_calls.load(), 1);

    // The worker marks the record once the transfer has unwound.
    TransferStatus st;
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
        if (st.state == TransferState::Failed) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(st.state, TransferState::Failed);

    u64 written = 0;
    EXPECT_EQ(lw.write(view_of(block), &written), boom);
    EXPECT_EQ(written, 0u);
}

TEST_F(LayerWriterTest, CommitCancelDoesNotWaitForInflightPart) {
    const std::string data = "abc";
    const Descriptor desc = layer_desc(data);

    std::atomic<bool> release{false};
    std::atomic<bool> entered{false};
    store_.upload_part_fn = [&](const Repository&, const std::string&, ByteRange, BufferView) {
        entered = true;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return ocipush::core::ok_status();
    };

    {
        LayerWriter lw;
        ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
        u64 written = 0;
        ASSERT_EQ(lw.write(view_of(data), &written).code, StatusCode::Ok);
        while (!entered.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        std::stop_source cancel;
        std::thread canceler([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            cancel.request_stop();
        });
        const Status s = lw.commit(0, desc.digest, cancel.get_token());
        canceler.join();

        EXPECT_EQ(s.code, StatusCode::Canceled);
        EXPECT_FALSE(release.load());
        EXPECT_EQ(store_.complete_calls.load(), 0);

        TransferStatus st;
        ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
        EXPECT_EQ(st.state, TransferState::Failed);

        // Destroying the writer waits for the in-flight part.
        release = true;
    }
    EXPECT_EQ(store_.upload_part_calls.load(), 1);
}

TEST_F(LayerWriterTest, DestructorAbortsOpenUpload) {
    const Descriptor desc = layer_desc("abc");
    {
        LayerWriter lw;
        ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
        u64 written = 0;
        ASSERT_EQ(lw.write(view_of("a"), &written).code, StatusCode::Ok);
    }
    EXPECT_EQ(store_.complete_calls.load(), 0);
}

TEST_F(LayerWriterTest, AbortFailsLaterWrites) {
    const Descriptor desc = layer_desc("abc");
    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, desc, tracker_).code, StatusCode::Ok);
    lw.abort();

    TransferStatus st;
    ASSERT_EQ(lw.status(&st).code, StatusCode::Ok);
    EXPECT_EQ(st.state, TransferState::Failed);

    u64 written = 0;
    EXPECT_NE(lw.write(view_of("a"), &written).code, StatusCode::Ok);
    EXPECT_EQ(lw.commit(0, desc.digest).code, StatusCode::Invalid);
}

TEST_F(LayerWriterTest, InitiateFailureIsReturned) {
    const Status denied = ocipush::core::make_status(StatusDomain::Registry, StatusCode::Network, 403);
    store_.initiate_fn = [&](const Repository&, UploadSession*) { return denied; };

    LayerWriter lw;
    EXPECT_EQ(lw.open(store_, repo_, layer_desc("abc"), tracker_), denied);

    u64 written = 0;
    EXPECT_EQ(lw.write(view_of("a"), &written).code, StatusCode::Invalid);
}

TEST_F(LayerWriterTest, ZeroPartSizeIsInvalid) {
    store_.initiate_fn = [](const Repository&, UploadSession* out) {
        out->upload_id = "u";
        out->part_size = 0;
        return ocipush::core::ok_status();
    };
    LayerWriter lw;
    EXPECT_EQ(lw.open(store_, repo_, layer_desc("abc"), tracker_).code, StatusCode::Invalid);
}

TEST_F(LayerWriterTest, CloseAndTruncateUnsupported) {
    LayerWriter lw;
    ASSERT_EQ(lw.open(store_, repo_, layer_desc("abc"), tracker_).code, StatusCode::Ok);
    EXPECT_EQ(lw.close().code, StatusCode::Unsupported);
    EXPECT_EQ(lw.truncate(0).code, StatusCode::Unsupported);
}
