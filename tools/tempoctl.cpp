/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/core/log.hpp"

#include <CLI/CLI.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <iostream>

/**
 * Queries the status socket of a running tempod and prints the response.
 */
int main(int const argc, char* argv[]) {
    tempo::set_log_level_from_env();

    CLI::App app {"tempoctl - query a running tempod"};

    std::string socket_path = "/run/tempod.sock";
    app.add_option("-s,--socket", socket_path, "Path of the status socket");

    std::string request = "status";
    app.add_option("request", request, "The request to send")->check(CLI::IsMember({"status", "ports", "clock"}));

    CLI11_PARSE(app, argc, argv);

    boost::asio::io_context io_context;
    boost::asio::local::stream_protocol::socket socket(io_context);

    boost::system::error_code ec;
    socket.connect(boost::asio::local::stream_protocol::endpoint(socket_path), ec);
    if (ec) {
        TEMPO_ERROR("Failed to connect to {}: {}", socket_path, ec.message());
        return 1;
    }

    const auto line = request + "\n";
    boost::asio::write(socket, boost::asio::buffer(line), ec);
    if (ec) {
        TEMPO_ERROR("Failed to send request: {}", ec.message());
        return 1;
    }

    // The server closes the connection after the response.
    boost::asio::streambuf response;
    boost::asio::read(socket, response, ec);
    if (ec && ec != boost::asio::error::eof) {
        TEMPO_ERROR("Failed to read response: {}", ec.message());
        return 1;
    }

    std::cout << &response;
    return 0;
}
