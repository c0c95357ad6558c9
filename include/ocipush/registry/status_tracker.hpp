#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ocipush/core/errors.hpp"
#include "ocipush/core/types.hpp"

namespace ocipush::registry {
    using u8 = ocipush::core::u8;
    using u64 = ocipush::core::u64;

    enum class TransferState : u8 {
        Waiting = 0,
        Resolving,
        Downloading,
        Uploading,
        Committing,
        Done,
        Exists,
        Failed,
    };

    [[nodiscard]] const char* transfer_state_name(TransferState state) noexcept;

    struct TransferStatus {
        std::string ref;
        TransferState state{TransferState::Waiting};
        u64 offset{0};                          // Bytes confirmed by the store
        u64 total{0};                           // Expected size, 0 if unknown
        ocipush::core::Timestamp started_at{0};
        ocipush::core::Timestamp updated_at{0};
        std::string upload_id;
    };

    // Per-reference transfer status shared between upload workers and
    // whatever polls for display. All access is serialised by one mutex.
    class StatusTracker {
    public:
        StatusTracker() = default;

        StatusTracker(const StatusTracker&) = delete;
        StatusTracker& operator=(const StatusTracker&) = delete;

        // Inserts or replaces the record keyed by status.ref.
        void set(const TransferStatus& status);

        // NotFound if ref was never set.
        [[nodiscard]] ocipush::core::Status get(const std::string& ref, TransferStatus* out) const;

        [[nodiscard]] ocipush::core::Status set_state(const std::string& ref,
            TransferState state,
            ocipush::core::Timestamp now) noexcept;

        // Raises offset to at least the given value; a lower value only
        // refreshes updated_at.
        [[nodiscard]] ocipush::core::Status advance(const std::string& ref,
            u64 offset,
            ocipush::core::Timestamp now) noexcept;

        void erase(const std::string& ref) noexcept;

        [[nodiscard]] std::vector<TransferStatus> snapshot() const;

    private:
        mutable std::mutex mu_;
        std::unordered_map<std::string, TransferStatus> records_;
    };

    // Ordered set of references being pushed, for progress display.
    class JobList {
    public:
        explicit JobList(const StatusTracker& tracker) noexcept : tracker_(tracker) {}

        JobList(const JobList&) = delete;
        JobList& operator=(const JobList&) = delete;

        // Adding a reference twice keeps its first position.
        void add(const std::string& ref);

        // One entry per added reference, in insertion order. References the
        // tracker does not know yet read as Waiting.
        [[nodiscard]] std::vector<TransferStatus> snapshot() const;

        [[nodiscard]] size_t size() const noexcept;

    private:
        const StatusTracker& tracker_;
        mutable std::mutex mu_;
        std::unordered_set<std::string> jobs_;
        std::vector<std::string> ordered_;
    };

} // namespace ocipush::registry
