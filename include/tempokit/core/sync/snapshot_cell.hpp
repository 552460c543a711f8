/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace tempo {

/**
 * Holds the latest copy of a value which is written by a single owner and read by observers on other threads.
 * Readers can bound the time they are willing to wait for the writer, so a busy or stalled writer never blocks them
 * for longer than the given timeout.
 * @tparam T The type of the value. Must be copyable.
 */
template<class T>
class SnapshotCell {
  public:
    SnapshotCell() = default;

    explicit SnapshotCell(T initial) : value_(std::move(initial)) {}

    SnapshotCell(const SnapshotCell&) = delete;
    SnapshotCell& operator=(const SnapshotCell&) = delete;

    /**
     * Replaces the stored value.
     * @param value The new value.
     */
    void store(T value) {
        std::lock_guard lock(mutex_);
        value_ = std::move(value);
    }

    /**
     * Updates the stored value in place.
     * @param f Function receiving a reference to the stored value.
     */
    template<class F>
    void update(F&& f) {
        std::lock_guard lock(mutex_);
        f(value_);
    }

    /**
     * @return A copy of the stored value. Blocks until the writer is done.
     */
    [[nodiscard]] T load() const {
        std::lock_guard lock(mutex_);
        return value_;
    }

    /**
     * @param timeout The maximum time to wait for the writer.
     * @return A copy of the stored value, or an empty optional if the value could not be read within the timeout.
     */
    [[nodiscard]] std::optional<T> try_load_for(const std::chrono::milliseconds timeout) const {
        std::unique_lock lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(timeout)) {
            return std::nullopt;
        }
        return value_;
    }

  private:
    mutable std::timed_mutex mutex_;
    T value_ {};
};

}  // namespace tempo
