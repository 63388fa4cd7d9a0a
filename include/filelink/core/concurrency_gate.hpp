// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace filelink::core {

class ConcurrencyGate;

// One admission slot. Returned to the gate when destroyed or released.
class AdmissionToken {
public:
    AdmissionToken() = default;
    ~AdmissionToken() { release(); }

    // Non-copyable, movable
    AdmissionToken(const AdmissionToken&) = delete;
    AdmissionToken& operator=(const AdmissionToken&) = delete;
    AdmissionToken(AdmissionToken&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
    AdmissionToken& operator=(AdmissionToken&& other) noexcept {
        if (this != &other) {
            release();
            gate_ = other.gate_;
            other.gate_ = nullptr;
        }
        return *this;
    }

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }
    explicit operator bool() const noexcept { return held(); }

private:
    friend class ConcurrencyGate;
    explicit AdmissionToken(ConcurrencyGate* gate) noexcept : gate_(gate) {}

    ConcurrencyGate* gate_{nullptr};
};

// Counting admission control over remote-store sessions.
// Waiters are admitted strictly in arrival order; nobody is rejected.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(std::size_t capacity);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    // Blocks until a slot is free and every earlier waiter has been served
    [[nodiscard]] AdmissionToken acquire();

    // Gives up after timeout, leaving the queue order intact
    [[nodiscard]] std::optional<AdmissionToken> try_acquire_for(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t available() const noexcept;
    [[nodiscard]] std::size_t waiting() const noexcept;

private:
    friend class AdmissionToken;
    void release() noexcept;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t available_;
    std::uint64_t next_ticket_{0};
    std::deque<std::uint64_t> queue_;  // Tickets of waiting callers, oldest first
};

} // namespace filelink::core
