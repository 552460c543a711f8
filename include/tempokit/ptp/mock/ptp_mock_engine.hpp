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

#include "tempokit/ptp/ptp_engine.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace tempo::ptp {

/**
 * An engine which records the events it receives and answers with scripted actions.
 */
class MockEngine final: public Engine {
  public:
    using Script = std::function<std::vector<Action>(const PortIdentity& port, const Event& event)>;

    /**
     * Shared between the engine, which is owned by its port, and the test.
     */
    class Control {
      public:
        /**
         * @param script Called for every event, the returned actions are handed to the runtime.
         */
        void set_script(Script script);

        /**
         * @param primary The value is_primary() returns from now on.
         */
        void set_primary(bool primary);

        /**
         * @return All events received so far.
         */
        [[nodiscard]] std::vector<Event> get_events() const;

        /**
         * @return The number of events received so far.
         */
        [[nodiscard]] size_t num_events() const;

        /**
         * @param command A control command.
         * @return The number of times given command was received.
         */
        [[nodiscard]] size_t count_control(ControlCommand command) const;

      private:
        friend class MockEngine;

        mutable std::mutex mutex_;
        Script script_;
        std::vector<Event> events_;
        std::atomic_bool primary_ {};
    };

    MockEngine(const PortIdentity& port, std::shared_ptr<Control> control);

    /**
     * @param control The control shared by all engines the factory creates.
     * @return A factory creating engines bound to given control.
     */
    static EngineFactory factory(std::shared_ptr<Control> control);

    // Engine overrides
    std::vector<Action> handle_event(const Event& event) override;
    [[nodiscard]] bool is_primary() const override;

  private:
    PortIdentity port_;
    std::shared_ptr<Control> control_;
};

}  // namespace tempo::ptp
