/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_timer_service.hpp"

#include "tempokit/core/log.hpp"

namespace {

size_t slot_index(const tempo::ptp::TimerKind kind) {
    return static_cast<size_t>(kind);
}

}  // namespace

tempo::ptp::TimerService::Shared::Shared(const Strand& strand, FireHandler fire_handler) :
    handler(std::move(fire_handler)) {
    for (auto& slot : slots) {
        slot = std::make_unique<Slot>(strand);
    }
}

tempo::ptp::TimerService::TimerService(const Strand& strand, FireHandler handler) :
    shared_(std::make_shared<Shared>(strand, std::move(handler))) {
    TEMPO_ASSERT(shared_->handler != nullptr, "Timer service needs a handler");
}

tempo::ptp::TimerService::~TimerService() {
    cancel_all();
}

tempo::ptp::TimerHandle
tempo::ptp::TimerService::arm(const TimerKind kind, const std::chrono::nanoseconds duration, const bool recurring) {
    TEMPO_ASSERT(slot_index(kind) < k_num_timer_kinds, "Invalid timer kind");
    TEMPO_ASSERT(!recurring || duration.count() > 0, "A recurring timer needs a positive duration");

    auto& slot = *shared_->slots[slot_index(kind)];
    slot.timer.cancel();
    slot.generation++;
    slot.pending = true;
    slot.recurring = recurring;
    slot.duration = duration;
    slot.timer.expires_after(duration);
    wait(shared_, kind, slot.generation);

    TEMPO_TRACE("Armed {} timer ({} ns, recurring={})", to_string(kind), duration.count(), recurring);

    return {kind, slot.generation};
}

tl::expected<void, tempo::ptp::TimerError> tempo::ptp::TimerService::cancel(const TimerHandle& handle) {
    if (slot_index(handle.kind) >= k_num_timer_kinds) {
        return tl::unexpected(TimerError::unknown_handle);
    }

    auto& slot = *shared_->slots[slot_index(handle.kind)];
    if (handle.generation == 0 || handle.generation > slot.generation) {
        return tl::unexpected(TimerError::unknown_handle);
    }

    if (handle.generation < slot.generation) {
        return {};  // Superseded by a later arm.
    }

    slot.pending = false;
    slot.timer.cancel();
    return {};
}

void tempo::ptp::TimerService::cancel(const TimerKind kind) {
    TEMPO_ASSERT_RETURN(slot_index(kind) < k_num_timer_kinds, "Invalid timer kind");
    auto& slot = *shared_->slots[slot_index(kind)];
    slot.pending = false;
    slot.timer.cancel();
}

void tempo::ptp::TimerService::cancel_all() {
    for (auto& slot : shared_->slots) {
        slot->pending = false;
        slot->timer.cancel();
    }
}

bool tempo::ptp::TimerService::is_pending(const TimerKind kind) const {
    if (slot_index(kind) >= k_num_timer_kinds) {
        return false;
    }
    return shared_->slots[slot_index(kind)]->pending;
}

std::chrono::nanoseconds tempo::ptp::TimerService::get_duration(const TimerKind kind) const {
    if (slot_index(kind) >= k_num_timer_kinds) {
        return {};
    }
    return shared_->slots[slot_index(kind)]->duration;
}

void tempo::ptp::TimerService::wait(const std::shared_ptr<Shared>& shared, TimerKind kind, uint64_t generation) {
    auto& slot = *shared->slots[slot_index(kind)];
    slot.timer.async_wait([weak = std::weak_ptr(shared), kind, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        auto locked = weak.lock();
        if (locked == nullptr) {
            return;
        }

        auto& s = *locked->slots[slot_index(kind)];

        // A completion of an earlier arming which was already queued when the timer was re-armed or cancelled.
        if (!s.pending || s.generation != generation) {
            return;
        }

        if (ec) {
            TEMPO_ERROR("{} timer error: {}", to_string(kind), ec.message());
            s.pending = false;
            return;
        }

        if (s.recurring) {
            s.timer.expires_at(s.timer.expiry() + s.duration);
            wait(locked, kind, generation);
        } else {
            s.pending = false;
        }

        locked->handler(kind);
    });
}
