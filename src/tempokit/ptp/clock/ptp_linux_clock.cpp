/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/clock/ptp_linux_clock.hpp"

#include "tempokit/core/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/timex.h>
#include <unistd.h>

#ifndef CLOCKFD
    #define CLOCKFD 3
#endif

namespace {

clockid_t fd_to_clock_id(const int fd) {
    return static_cast<clockid_t>((~static_cast<unsigned int>(fd) << 3) | CLOCKFD);
}

tempo::ptp::SteeringError steering_error_from_errno(const int error) {
    switch (error) {
        case EPERM:
        case EACCES:
            return tempo::ptp::SteeringError::permission_denied;
        case ENODEV:
        case EBADF:
        case EOPNOTSUPP:
            return tempo::ptp::SteeringError::clock_unavailable;
        default:
            return tempo::ptp::SteeringError::adjustment_rejected;
    }
}

}  // namespace

tempo::ptp::LinuxClock::LinuxClock(const clockid_t clock_id, const int fd, std::string name) :
    clock_id_(clock_id), fd_(fd), name_(std::move(name)) {}

tempo::ptp::LinuxClock::~LinuxClock() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<tempo::ptp::LinuxClock> tempo::ptp::LinuxClock::open_system() {
    return std::unique_ptr<LinuxClock>(new LinuxClock(CLOCK_REALTIME, -1, "CLOCK_REALTIME"));
}

tl::expected<std::unique_ptr<tempo::ptp::LinuxClock>, tempo::ptp::SteeringError>
tempo::ptp::LinuxClock::open_phc(const int phc_index) {
    auto path = fmt::format("/dev/ptp{}", phc_index);
    const int fd = ::open(path.c_str(), O_RDWR);
    if (fd < 0) {
        TEMPO_ERROR("Failed to open {}: {}", path, std::strerror(errno));
        return tl::unexpected(steering_error_from_errno(errno == ENOENT ? ENODEV : errno));
    }
    return std::unique_ptr<LinuxClock>(new LinuxClock(fd_to_clock_id(fd), fd, std::move(path)));
}

tempo::ptp::Timestamp tempo::ptp::LinuxClock::now() const {
    timespec ts {};
    if (clock_gettime(clock_id_, &ts) != 0) {
        TEMPO_ERROR("Failed to read {}: {}", name_, std::strerror(errno));
        return {};
    }
    return Timestamp::from_timespec(ts);
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::LinuxClock::step(const std::chrono::nanoseconds delta) {
    auto seconds = delta.count() / 1'000'000'000;
    auto nanos = delta.count() % 1'000'000'000;
    // The kernel wants a non-negative nanoseconds part.
    if (nanos < 0) {
        seconds -= 1;
        nanos += 1'000'000'000;
    }

    timex tx {};
    tx.modes = ADJ_SETOFFSET | ADJ_NANO;
    tx.time.tv_sec = seconds;
    tx.time.tv_usec = nanos;

    if (clock_adjtime(clock_id_, &tx) < 0) {
        TEMPO_ERROR("Failed to step {} by {} ns: {}", name_, delta.count(), std::strerror(errno));
        return tl::unexpected(steering_error_from_errno(errno));
    }
    return {};
}

tl::expected<void, tempo::ptp::SteeringError> tempo::ptp::LinuxClock::set_frequency(const double ppb) {
    const auto clamped = std::clamp(ppb, -k_max_frequency_ppb, k_max_frequency_ppb);

    timex tx {};
    tx.modes = ADJ_FREQUENCY;
    // ppm with a 16 bit fractional part
    tx.freq = static_cast<long>(clamped * 65.536);

    if (clock_adjtime(clock_id_, &tx) < 0) {
        TEMPO_ERROR("Failed to set frequency of {} to {} ppb: {}", name_, clamped, std::strerror(errno));
        return tl::unexpected(steering_error_from_errno(errno));
    }
    return {};
}

tl::expected<void, tempo::ptp::SteeringError>
tempo::ptp::LinuxClock::set_time_properties(const TimeProperties& properties) {
    if (clock_id_ != CLOCK_REALTIME) {
        return {};  // Leap seconds and the TAI offset are kept by the system clock only.
    }

    timex tx {};
    if (clock_adjtime(clock_id_, &tx) < 0) {
        return tl::unexpected(steering_error_from_errno(errno));
    }

    tx.modes = ADJ_STATUS;
    tx.status &= ~(STA_INS | STA_DEL);
    if (properties.leap61) {
        tx.status |= STA_INS;
    } else if (properties.leap59) {
        tx.status |= STA_DEL;
    }

    if (clock_adjtime(clock_id_, &tx) < 0) {
        TEMPO_ERROR("Failed to set leap second status of {}: {}", name_, std::strerror(errno));
        return tl::unexpected(steering_error_from_errno(errno));
    }

    if (properties.current_utc_offset_valid) {
        timex tai {};
        tai.modes = ADJ_TAI;
        tai.constant = properties.current_utc_offset;
        if (clock_adjtime(clock_id_, &tai) < 0) {
            TEMPO_ERROR("Failed to set TAI offset of {}: {}", name_, std::strerror(errno));
            return tl::unexpected(steering_error_from_errno(errno));
        }
    }

    return {};
}

std::string tempo::ptp::LinuxClock::name() const {
    return name_;
}
