// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/concurrency_gate.hpp>
#include <algorithm>

namespace filelink::core {

//=============================================================================
// AdmissionToken
//=============================================================================

void AdmissionToken::release() noexcept {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

//=============================================================================
// ConcurrencyGate
//=============================================================================

ConcurrencyGate::ConcurrencyGate(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
    , available_(capacity_) {}

AdmissionToken ConcurrencyGate::acquire() {
    std::unique_lock lock(mutex_);
    const auto ticket = next_ticket_++;
    queue_.push_back(ticket);

    cv_.wait(lock, [&] { return available_ > 0 && queue_.front() == ticket; });

    queue_.pop_front();
    --available_;
    lock.unlock();

    // The next waiter may be admissible as well
    cv_.notify_all();
    return AdmissionToken(this);
}

std::optional<AdmissionToken> ConcurrencyGate::try_acquire_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    const auto ticket = next_ticket_++;
    queue_.push_back(ticket);

    bool admitted = cv_.wait_for(lock, timeout, [&] {
        return available_ > 0 && queue_.front() == ticket;
    });

    if (!admitted) {
        queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
        lock.unlock();
        cv_.notify_all();
        return std::nullopt;
    }

    queue_.pop_front();
    --available_;
    lock.unlock();
    cv_.notify_all();
    return AdmissionToken(this);
}

std::size_t ConcurrencyGate::available() const noexcept {
    std::lock_guard lock(mutex_);
    return available_;
}

std::size_t ConcurrencyGate::waiting() const noexcept {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void ConcurrencyGate::release() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (available_ < capacity_) {
            ++available_;
        }
    }
    cv_.notify_all();
}

} // namespace filelink::core
