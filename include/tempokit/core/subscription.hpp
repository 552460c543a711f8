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

#include <functional>

namespace tempo {

/**
 * A simple class which executes given function upon destruction.
 * Very suitable for releasing OS handles or subscriptions when the owning scope or class goes away.
 */
class Subscription {
  public:
    Subscription() = default;

    explicit Subscription(std::function<void()> on_destruction_callback) :
        on_destruction_callback_(std::move(on_destruction_callback)) {}

    Subscription(const Subscription& other) = delete;
    Subscription& operator=(const Subscription& other) = delete;

    Subscription(Subscription&& other) noexcept {
        *this = std::move(other);
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (on_destruction_callback_) {
            on_destruction_callback_();
        }

        on_destruction_callback_ = std::move(other.on_destruction_callback_);
        other.on_destruction_callback_ = nullptr;

        return *this;
    }

    ~Subscription() {
        if (on_destruction_callback_) {
            on_destruction_callback_();
        }
    }

    /**
     * @return True if the subscription holds a callback.
     */
    explicit operator bool() const {
        return on_destruction_callback_ != nullptr;
    }

    /**
     * Resets this subscription by calling the callback (if any) and then clearing it.
     */
    void reset() {
        if (on_destruction_callback_) {
            on_destruction_callback_();
            on_destruction_callback_ = nullptr;
        }
    }

    /**
     * Releases (clears) the destruction callback without invoking it. Used to hand ownership of the guarded resource
     * to somebody else.
     */
    void release() {
        on_destruction_callback_ = nullptr;
    }

  private:
    std::function<void()> on_destruction_callback_;
};

/**
 * Convenience alias for Subscription. Use this if you want to defer some action until the end of the scope.
 */
using Defer = Subscription;

}  // namespace tempo
