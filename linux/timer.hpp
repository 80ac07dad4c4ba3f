#pragma once

#include <cstdint>

namespace timer {

// Periodic monotonic timerfd
struct Periodic {
    int fd = -1;

    bool is_open() const { return fd >= 0; }
    void close();

    // Move-only
    Periodic() = default;
    explicit Periodic(int fd) : fd(fd) {}
    Periodic(Periodic&& other) noexcept;
    Periodic& operator=(Periodic&& other) noexcept;
    ~Periodic();

    Periodic(const Periodic&) = delete;
    Periodic& operator=(const Periodic&) = delete;
};

// Create a non-blocking timer firing every period_ms
// Returns a closed timer on failure
Periodic start(int64_t period_ms);

// Consume pending expirations, returns how many ticks elapsed (0 if none)
uint64_t drain(const Periodic& timer);

// Get file descriptor for poll/select
inline int get_fd(const Periodic& timer) { return timer.fd; }

} // namespace timer
