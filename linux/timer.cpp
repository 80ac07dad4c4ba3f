#include "timer.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace timer {

Periodic::Periodic(Periodic&& other) noexcept : fd(other.fd) {
    other.fd = -1;
}

Periodic& Periodic::operator=(Periodic&& other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

Periodic::~Periodic() {
    close();
}

void Periodic::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

Periodic start(int64_t period_ms) {
    if (period_ms <= 0) {
        std::cerr << "timer: invalid period " << period_ms << std::endl;
        return {};
    }

    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        std::cerr << "timer: timerfd_create failed: " << strerror(errno) << std::endl;
        return {};
    }

    Periodic timer(fd);

    itimerspec its{};
    its.it_interval.tv_sec = period_ms / 1000;
    its.it_interval.tv_nsec = (period_ms % 1000) * 1000000;
    its.it_value = its.it_interval;

    if (timerfd_settime(fd, 0, &its, nullptr) < 0) {
        std::cerr << "timer: timerfd_settime failed: " << strerror(errno) << std::endl;
        return {};
    }

    return timer;
}

uint64_t drain(const Periodic& timer) {
    if (!timer.is_open()) return 0;

    uint64_t expirations = 0;
    ssize_t n = ::read(timer.fd, &expirations, sizeof(expirations));
    if (n != sizeof(expirations)) {
        if (n < 0 && errno != EAGAIN) {
            std::cerr << "timer: read failed: " << strerror(errno) << std::endl;
        }
        return 0;
    }
    return expirations;
}

} // namespace timer
