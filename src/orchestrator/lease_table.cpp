#include "cork/lease_table.hpp"

namespace cork {

// ============================================================================
// Lease
// ============================================================================

Lease::~Lease() {
    release();
}

Lease::Lease(Lease&& other) noexcept : table_(other.table_), name_(std::move(other.name_)) {
    other.table_ = nullptr;
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        name_ = std::move(other.name_);
        other.table_ = nullptr;
    }
    return *this;
}

void Lease::release() {
    if (table_) {
        table_->release(name_);
        table_ = nullptr;
    }
}

// ============================================================================
// LeaseTable
// ============================================================================

Lease LeaseTable::acquire(const std::string& name) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& slot = slots_[name];
    uint64_t ticket = slot.next_ticket++;

    cv_.wait(lock, [&] { return slots_[name].now_serving == ticket; });
    return Lease(this, name);
}

void LeaseTable::release(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(name);
        if (it == slots_.end()) return;

        auto& slot = it->second;
        ++slot.now_serving;
        if (slot.now_serving == slot.next_ticket) {
            slots_.erase(it);
        }
    }
    cv_.notify_all();
}

size_t LeaseTable::waiting(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(name);
    if (it == slots_.end()) return 0;
    return static_cast<size_t>(it->second.next_ticket - it->second.now_serving);
}

} // namespace cork
