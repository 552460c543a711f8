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

#include "ptp_clock_correction.hpp"
#include "ptp_port_runtime.hpp"
#include "tempokit/core/expected.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tempo::ptp {

/**
 * Provides the data served by the status endpoint. Implementations must not block longer than the given timeout.
 */
class StatusSource {
  public:
    virtual ~StatusSource() = default;

    /**
     * @param timeout Maximum time to wait for a single port snapshot.
     * @return The state of every port.
     */
    virtual std::vector<PortState> get_port_states(std::chrono::milliseconds timeout) = 0;

    /**
     * @param timeout Maximum time to wait for the clock snapshot.
     * @return The state of the steered clock.
     */
    virtual ClockState get_clock_state(std::chrono::milliseconds timeout) = 0;
};

struct StatusEndpointConfig {
    std::string socket_path {"/run/tempod.sock"};
    /// Clients which do not send a complete request within this time are disconnected.
    std::chrono::milliseconds request_timeout {1000};
    /// Maximum time to wait for a snapshot.
    std::chrono::milliseconds snapshot_timeout {100};
};

/**
 * Serves read-only status queries on a unix domain socket. A client sends one line (`status`, `ports` or `clock`) and
 * receives one JSON document followed by a newline, after which the connection is closed.
 */
class StatusEndpoint {
  public:
    /// Requests longer than this are rejected.
    static constexpr size_t k_max_request_size = 256;

    StatusEndpoint(boost::asio::io_context& io_context, StatusSource& source, StatusEndpointConfig config);
    ~StatusEndpoint();

    StatusEndpoint(const StatusEndpoint&) = delete;
    StatusEndpoint& operator=(const StatusEndpoint&) = delete;

    StatusEndpoint(StatusEndpoint&&) = delete;
    StatusEndpoint& operator=(StatusEndpoint&&) = delete;

    /**
     * Binds the socket and starts accepting connections. A stale socket file at the path is removed first.
     * @return An error if the socket could not be bound.
     */
    tl::expected<void, boost::system::error_code> start();

    /**
     * Stops accepting, closes open connections and removes the socket file. Idempotent.
     */
    void stop();

    /**
     * Produces the response to a request.
     * @param request The request line, without line ending.
     * @param source The data source.
     * @param timeout The snapshot timeout.
     * @return The JSON response, without line ending.
     */
    static std::string handle_request(std::string_view request, StatusSource& source, std::chrono::milliseconds timeout);

  private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace tempo::ptp
