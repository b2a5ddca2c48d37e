#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cork {

// ============================================================================
// Per-Name Exclusive Leases
// ============================================================================

class LeaseTable;

/// RAII handle; releasing wakes the next waiter for the same name
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    bool isHeld() const { return table_ != nullptr; }
    const std::string& name() const { return name_; }

    void release();

private:
    friend class LeaseTable;
    Lease(LeaseTable* table, std::string name) : table_(table), name_(std::move(name)) {}

    LeaseTable* table_ = nullptr;
    std::string name_;
};

/**
 * Grants at most one lease per name at a time. Waiters for the same name
 * are served strictly in arrival order; different names never block each
 * other.
 */
class LeaseTable {
public:
    LeaseTable() = default;
    LeaseTable(const LeaseTable&) = delete;
    LeaseTable& operator=(const LeaseTable&) = delete;

    /// Blocks until the lease for `name` is granted
    Lease acquire(const std::string& name);

    /// Requests queued or holding a lease for `name`
    size_t waiting(const std::string& name) const;

private:
    friend class Lease;
    void release(const std::string& name);

    struct Slot {
        uint64_t next_ticket = 0;
        uint64_t now_serving = 0;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Slot> slots_;
};

// ============================================================================
// Cooperative Cancellation
// ============================================================================

/// Shared flag checked by installers between steps
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace cork
