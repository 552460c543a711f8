/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/mock/ptp_mock_engine.hpp"

void tempo::ptp::MockEngine::Control::set_script(Script script) {
    std::lock_guard lock(mutex_);
    script_ = std::move(script);
}

void tempo::ptp::MockEngine::Control::set_primary(const bool primary) {
    primary_ = primary;
}

std::vector<tempo::ptp::Event> tempo::ptp::MockEngine::Control::get_events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

size_t tempo::ptp::MockEngine::Control::num_events() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

size_t tempo::ptp::MockEngine::Control::count_control(const ControlCommand command) const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& event : events_) {
        if (const auto* control = std::get_if<ControlEvent>(&event); control && control->command == command) {
            count++;
        }
    }
    return count;
}

tempo::ptp::MockEngine::MockEngine(const PortIdentity& port, std::shared_ptr<Control> control) :
    port_(port), control_(std::move(control)) {}

tempo::ptp::EngineFactory tempo::ptp::MockEngine::factory(std::shared_ptr<Control> control) {
    return [control = std::move(control)](const PortIdentity& port, const EngineConfig&) -> std::unique_ptr<Engine> {
        return std::make_unique<MockEngine>(port, control);
    };
}

std::vector<tempo::ptp::Action> tempo::ptp::MockEngine::handle_event(const Event& event) {
    Script script;
    {
        std::lock_guard lock(control_->mutex_);
        control_->events_.push_back(event);
        script = control_->script_;
    }
    if (script == nullptr) {
        return {};
    }
    return script(port_, event);
}

bool tempo::ptp::MockEngine::is_primary() const {
    return control_->primary_;
}
