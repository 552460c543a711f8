/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "ptp_test_util.test.hpp"
#include "tempokit/core/asio/io_context_runner.hpp"
#include "tempokit/core/json.hpp"
#include "tempokit/ptp/ptp_status_endpoint.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include <atomic>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace tempo::ptp;

namespace {

class FakeStatusSource final: public StatusSource {
  public:
    std::atomic<int> num_requests {};

    std::vector<PortState> get_port_states(std::chrono::milliseconds) override {
        num_requests++;
        PortState state;
        state.identity = test::make_port_identity(0x01, 1);
        state.interface_name = "eth0";
        state.state = State::slave;
        state.offset = -250ns;
        state.timestamping = TimestampSource::hardware;
        state.transport_failures = 2;
        state.primary = true;
        return {state};
    }

    ClockState get_clock_state(std::chrono::milliseconds) override {
        num_requests++;
        ClockState state;
        state.frequency_ppb = 12.5;
        state.stable = true;
        state.steps = 1;
        state.slews = 41;
        state.primary = test::make_port_identity(0x01, 1);
        state.primary_epoch = 3;
        return state;
    }
};

std::string make_socket_path() {
    static int counter = 0;
    return fmt::format("/tmp/tempokit-test-{}-{}.sock", ::getpid(), counter++);
}

/**
 * Connects, sends given data and reads until the server closes the connection.
 */
std::string query(const std::string& socket_path, const std::string& data) {
    boost::asio::io_context io_context;
    boost::asio::local::stream_protocol::socket socket(io_context);
    socket.connect(boost::asio::local::stream_protocol::endpoint(socket_path));
    if (!data.empty()) {
        boost::asio::write(socket, boost::asio::buffer(data));
    }

    std::string response;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::dynamic_buffer(response), ec);
    REQUIRE(ec == boost::asio::error::eof);
    return response;
}

}  // namespace

TEST_CASE("tempo::ptp::StatusEndpoint::handle_request") {
    FakeStatusSource source;

    SECTION("Status") {
        const auto response = StatusEndpoint::handle_request("status\n", source, 10ms);
        const auto json = boost::json::parse(response);

        const auto& ports = json.as_object().at("ports").as_array();
        REQUIRE(ports.size() == 1);
        const auto& port = ports.at(0).as_object();
        REQUIRE(port.at("interface").as_string() == "eth0");
        REQUIRE(port.at("state").as_string() == "slave");
        REQUIRE(port.at("offset_ns").as_int64() == -250);
        REQUIRE(port.at("timestamping").as_string() == "hardware");
        REQUIRE(port.at("transport_failures").to_number<int>() == 2);
        REQUIRE(port.at("primary").as_bool());
        REQUIRE(port.at("identity").as_object().at("clock_identity").as_string() == "00-1d-c1-ff-fe-00-00-01");
        REQUIRE(port.at("identity").as_object().at("port_number").to_number<int>() == 1);

        const auto& clock = json.as_object().at("clock").as_object();
        REQUIRE(clock.at("frequency_ppb").as_double() == Catch::Approx(12.5));
        REQUIRE(clock.at("stable").as_bool());
        REQUIRE(clock.at("steps").to_number<int>() == 1);
        REQUIRE(clock.at("slews").to_number<int>() == 41);
        REQUIRE(clock.at("last_correction").is_null());
        REQUIRE(clock.at("primary").as_object().at("port_number").to_number<int>() == 1);
        REQUIRE(clock.at("primary_epoch").to_number<int>() == 3);
    }

    SECTION("Ports") {
        const auto json = boost::json::parse(StatusEndpoint::handle_request("ports", source, 10ms));
        REQUIRE(json.as_object().contains("ports"));
        REQUIRE_FALSE(json.as_object().contains("clock"));
    }

    SECTION("Clock") {
        const auto json = boost::json::parse(StatusEndpoint::handle_request("  clock \r\n", source, 10ms));
        REQUIRE(json.as_object().contains("clock"));
        REQUIRE_FALSE(json.as_object().contains("ports"));
    }

    SECTION("Unknown request") {
        const auto json = boost::json::parse(StatusEndpoint::handle_request("restart", source, 10ms));
        REQUIRE(json.as_object().at("error").as_string() == "unknown request: restart");
        REQUIRE(source.num_requests == 0);
    }
}

TEST_CASE("tempo::ptp::StatusEndpoint") {
    FakeStatusSource source;
    tempo::IoContextRunner runner(1);

    StatusEndpointConfig config;
    config.socket_path = make_socket_path();
    config.request_timeout = 100ms;

    StatusEndpoint endpoint(runner.io_context(), source, config);
    const auto started = endpoint.start();
    REQUIRE(started.has_value());

    SECTION("Answers one request per connection") {
        const auto response = query(config.socket_path, "status\n");
        REQUIRE(response.back() == '\n');
        const auto json = boost::json::parse(response);
        REQUIRE(json.as_object().at("ports").as_array().size() == 1);

        // The server keeps accepting
        const auto second = query(config.socket_path, "clock\n");
        REQUIRE(boost::json::parse(second).as_object().contains("clock"));
    }

    SECTION("A request without line ending is answered at end of stream") {
        boost::asio::io_context io_context;
        boost::asio::local::stream_protocol::socket socket(io_context);
        socket.connect(boost::asio::local::stream_protocol::endpoint(config.socket_path));
        boost::asio::write(socket, boost::asio::buffer(std::string("ports")));
        socket.shutdown(boost::asio::local::stream_protocol::socket::shutdown_send);

        std::string response;
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::dynamic_buffer(response), ec);
        REQUIRE(boost::json::parse(response).as_object().contains("ports"));
    }

    SECTION("Unknown requests get an error") {
        const auto response = query(config.socket_path, "hello\n");
        REQUIRE(boost::json::parse(response).as_object().at("error").as_string() == "unknown request: hello");
    }

    SECTION("Overlong requests are rejected") {
        const std::string request(StatusEndpoint::k_max_request_size, 'x');
        const auto response = query(config.socket_path, request);
        REQUIRE(boost::json::parse(response).as_object().at("error").as_string() == "request too long");
        REQUIRE(source.num_requests == 0);
    }

    SECTION("Idle clients are disconnected") {
        const auto start = std::chrono::steady_clock::now();
        const auto response = query(config.socket_path, {});
        REQUIRE(response.empty());
        REQUIRE(std::chrono::steady_clock::now() - start < test::k_default_timeout);
        REQUIRE(source.num_requests == 0);
    }

    SECTION("Stop removes the socket") {
        endpoint.stop();
        REQUIRE(::access(config.socket_path.c_str(), F_OK) != 0);

        boost::asio::io_context io_context;
        boost::asio::local::stream_protocol::socket socket(io_context);
        boost::system::error_code ec;
        socket.connect(boost::asio::local::stream_protocol::endpoint(config.socket_path), ec);
        REQUIRE(ec);

        // Idempotent
        endpoint.stop();
    }

    endpoint.stop();
    runner.stop();
}

TEST_CASE("tempo::ptp::StatusEndpoint reports bind failures") {
    FakeStatusSource source;
    boost::asio::io_context io_context;

    StatusEndpointConfig config;
    config.socket_path = "/nonexistent-directory/tempod.sock";

    StatusEndpoint endpoint(io_context, source, config);
    const auto result = endpoint.start();
    REQUIRE_FALSE(result.has_value());
}
