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

#include <algorithm>
#include <mutex>
#include <vector>

namespace tempo {

/**
 * List of subscribers which can be modified from any thread while notifications run on another.
 * A subscriber which has been removed is never called again once remove() returned, so a subscriber only needs to
 * outlive its own removal.
 * @tparam T The type of the subscriber.
 */
template<class T>
class SubscriberList {
  public:
    SubscriberList() = default;

    SubscriberList(const SubscriberList&) = delete;
    SubscriberList& operator=(const SubscriberList&) = delete;

    SubscriberList(SubscriberList&&) = delete;
    SubscriberList& operator=(SubscriberList&&) = delete;

    /**
     * Adds the given subscriber to the list.
     * @param subscriber The subscriber to add. Null is refused.
     * @return true if the subscriber was added, or false if it was null or already in the list.
     */
    bool add(T* subscriber) {
        if (subscriber == nullptr) {
            return false;
        }
        std::lock_guard lock(mutex_);
        if (find(subscriber) != subscribers_.end()) {
            return false;
        }
        subscribers_.push_back(subscriber);
        return true;
    }

    /**
     * Removes the given subscriber from the list. Waits for a notification in progress to finish.
     * @param subscriber The subscriber to remove.
     * @returns true if the subscriber was removed, or false if it was not in the list.
     */
    bool remove(const T* subscriber) {
        std::lock_guard lock(mutex_);
        const auto it = find(subscriber);
        if (it == subscribers_.end()) {
            return false;
        }
        subscribers_.erase(it);
        return true;
    }

    /**
     * Calls given function for each subscriber, in the order they were added. Subscribers must not add or remove
     * themselves from within the call.
     * @param f The function to call for each subscriber.
     */
    template<class F>
    void foreach (F&& f) {
        std::lock_guard lock(mutex_);
        for (auto* subscriber : subscribers_) {
            f(subscriber);
        }
    }

    /**
     * @param subscriber The subscriber to check.
     * @return true if the list contains the subscriber, or false if not.
     */
    [[nodiscard]] bool contains(const T* subscriber) const {
        std::lock_guard lock(mutex_);
        return find(subscriber) != subscribers_.end();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return subscribers_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return subscribers_.empty();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<T*> subscribers_;

    typename std::vector<T*>::const_iterator find(const T* subscriber) const {
        return std::find(subscribers_.begin(), subscribers_.end(), subscriber);
    }
};

}  // namespace tempo
