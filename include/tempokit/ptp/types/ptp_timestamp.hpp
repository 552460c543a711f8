/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include "tempokit/core/byte_order.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace tempo::ptp {

/**
 * A point in time with nanosecond resolution, consisting of a seconds and nanoseconds part.
 * The epoch depends on the clock that produced the timestamp: the PTP epoch for values on the wire, the unix epoch for
 * CLOCK_REALTIME or a PHC.
 */
class Timestamp {
  public:
    /// Size on the wire in bytes.
    static constexpr size_t k_size = 10;

    Timestamp() = default;

    /**
     * Create a timestamp from seconds and nanoseconds.
     * @param seconds The number of seconds.
     * @param nanoseconds The number of nanoseconds, [0, 1'000'000'000).
     */
    Timestamp(const uint64_t seconds, const uint32_t nanoseconds) : seconds_(seconds), nanoseconds_(nanoseconds) {}

    /**
     * Create a timestamp from a number of nanoseconds.
     * @param nanos The number of nanoseconds since the epoch.
     */
    static Timestamp from_nanoseconds(const uint64_t nanos) {
        return {nanos / 1'000'000'000, static_cast<uint32_t>(nanos % 1'000'000'000)};
    }

    /**
     * Create a timestamp from a timespec as filled by the kernel.
     * @param ts The timespec. Negative values are clamped to zero.
     */
    static Timestamp from_timespec(const timespec& ts) {
        if (ts.tv_sec < 0 || ts.tv_nsec < 0) {
            return {};
        }
        return {static_cast<uint64_t>(ts.tv_sec), static_cast<uint32_t>(ts.tv_nsec)};
    }

    /**
     * Create a timestamp from wire data, in network byte order. No bounds checking is performed.
     * @param data Pointer to at least 10 bytes.
     */
    static Timestamp from_data(const uint8_t* data) {
        return {read_be_uint48(data), read_be<uint32_t>(data + 6)};
    }

    /**
     * Writes the timestamp in wire format.
     * @param dst Destination of at least 10 bytes.
     */
    void write_to(uint8_t* dst) const {
        write_be_uint48(dst, seconds_);
        write_be<uint32_t>(dst + 6, nanoseconds_);
    }

    /**
     * @return The number of nanoseconds represented by this timestamp. If the resulting number of nanoseconds is too
     * large to fit, the behaviour is undefined.
     */
    [[nodiscard]] uint64_t to_nanoseconds() const {
        return seconds_ * 1'000'000'000 + nanoseconds_;
    }

    /**
     * @return The seconds part of this timestamp (does not include the nanoseconds).
     */
    [[nodiscard]] uint64_t raw_seconds() const {
        return seconds_;
    }

    /**
     * @return The nanoseconds part of this timestamp (does not include the seconds).
     */
    [[nodiscard]] uint32_t raw_nanoseconds() const {
        return nanoseconds_;
    }

    /**
     * @return True if the timestamp is valid, false otherwise. The timestamp is considered valid when it is not zero.
     */
    [[nodiscard]] bool valid() const {
        return seconds_ != 0 || nanoseconds_ != 0;
    }

    /**
     * @return A string representation of the timestamp.
     */
    [[nodiscard]] std::string to_string() const {
        return fmt::format("{}.{:09}", seconds_, nanoseconds_);
    }

    /**
     * @return The signed difference lhs - rhs.
     */
    friend std::chrono::nanoseconds operator-(const Timestamp& lhs, const Timestamp& rhs) {
        const auto seconds = static_cast<int64_t>(lhs.seconds_) - static_cast<int64_t>(rhs.seconds_);
        const auto nanos = static_cast<int64_t>(lhs.nanoseconds_) - static_cast<int64_t>(rhs.nanoseconds_);
        return std::chrono::nanoseconds(seconds * 1'000'000'000 + nanos);
    }

    friend bool operator==(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.seconds_ == rhs.seconds_ && lhs.nanoseconds_ == rhs.nanoseconds_;
    }

    friend bool operator!=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator<(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.seconds_ < rhs.seconds_ || (lhs.seconds_ == rhs.seconds_ && lhs.nanoseconds_ < rhs.nanoseconds_);
    }

  private:
    uint64_t seconds_ {};      // 6 bytes (48 bits) on the wire
    uint32_t nanoseconds_ {};  // 4 bytes (32 bits) on the wire [0, 1'000'000'000).
};

/**
 * Where a packet timestamp came from, from most to least trustworthy.
 */
enum class TimestampSource : uint8_t {
    /// Captured by the network interface.
    hardware,
    /// Captured by the kernel when the packet passed the network stack.
    software,
    /// Read by this process after the system call returned.
    user_space,
};

inline const char* to_string(const TimestampSource source) {
    switch (source) {
        case TimestampSource::hardware:
            return "hardware";
        case TimestampSource::software:
            return "software";
        case TimestampSource::user_space:
            return "user_space";
        default:
            return "unknown";
    }
}

/**
 * A timestamp tagged with its source.
 */
struct CapturedTimestamp {
    Timestamp time;
    TimestampSource source {TimestampSource::user_space};

    /**
     * @return True when the timestamp was not captured by hardware. Interpreting the confidence is up to the engine.
     */
    [[nodiscard]] bool is_low_confidence() const {
        return source != TimestampSource::hardware;
    }
};

}  // namespace tempo::ptp
