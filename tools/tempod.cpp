/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/core/json.hpp"
#include "tempokit/core/log.hpp"
#include "tempokit/ptp/ptp_daemon_config.hpp"
#include "tempokit/ptp/ptp_supervisor.hpp"

#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>

namespace {

constexpr int k_exit_ok = 0;
constexpr int k_exit_startup_failure = 1;
constexpr int k_exit_invalid_config = 2;

/**
 * Raises the verbosity by one level per -v, starting from info.
 */
void apply_verbosity(const size_t verbosity) {
    if (verbosity >= 2) {
        tempo::set_log_level("TRACE");
    } else if (verbosity == 1) {
        tempo::set_log_level("DEBUG");
    }
}

}  // namespace

/**
 * PTP daemon: synchronizes the local clock to a PTP reference on one or more network interfaces.
 */
int main(int const argc, char* argv[]) {
    tempo::set_log_level_from_env();

    CLI::App app {"tempod - PTP time synchronization daemon"};

    std::vector<std::string> interfaces;
    app.add_option("-i,--interface", interfaces, "Network interface to run a PTP port on (repeatable)");

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON configuration file")->check(CLI::ExistingFile);

    std::string timestamping;
    app.add_option("--timestamping", timestamping, "Timestamping mode of all ports")
        ->check(CLI::IsMember({"hardware", "software"}));

    std::string clock;
    app.add_option("--clock", clock, "The clock to steer")->check(CLI::IsMember({"system", "phc", "virtual"}));

    std::optional<int> phc_index;
    app.add_option("--phc-index", phc_index, "Index of the PTP hardware clock (/dev/ptpN) to steer");

    std::string status_socket;
    app.add_option("--status-socket", status_socket, "Path of the status socket");

    std::string log_level;
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)");

    const auto* verbose = app.add_flag("-v,--verbose", "Increase verbosity (repeatable)");

    bool print_config = false;
    app.add_flag("--print-config", print_config, "Print the effective configuration and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const auto code = app.exit(e);
        return code == 0 ? k_exit_ok : k_exit_invalid_config;
    }

    if (!log_level.empty() && !tempo::set_log_level(log_level.c_str())) {
        return k_exit_invalid_config;
    }
    apply_verbosity(verbose->count());

    tempo::ptp::DaemonConfig config;
    if (!config_file.empty()) {
        auto loaded = tempo::ptp::DaemonConfig::load_file(config_file);
        if (!loaded) {
            TEMPO_CRITICAL("Failed to load {}: {}", config_file, to_string(loaded.error()));
            return k_exit_invalid_config;
        }
        config = std::move(loaded.value());
    }

    if (!interfaces.empty()) {
        config.ports.clear();
        for (auto& interface_name : interfaces) {
            config.ports.push_back({std::move(interface_name), tempo::ptp::TimestampingMode::hardware});
        }
    }
    if (!timestamping.empty()) {
        const auto mode = tempo::ptp::timestamping_mode_from_string(timestamping);
        for (auto& port : config.ports) {
            port.timestamping = mode.value_or(tempo::ptp::TimestampingMode::hardware);
        }
    }
    if (!clock.empty()) {
        config.clock = tempo::ptp::clock_kind_from_string(clock).value_or(tempo::ptp::ClockKind::system);
    }
    if (phc_index) {
        config.phc_index = phc_index;
    }
    if (!status_socket.empty()) {
        config.status.socket_path = status_socket;
    }

    if (print_config) {
        fmt::println("{}", tempo::to_json_string(config));
        return k_exit_ok;
    }

    if (const auto valid = config.validate(); !valid) {
        TEMPO_CRITICAL("Invalid configuration: {}", to_string(valid.error()));
        return k_exit_invalid_config;
    }

    TEMPO_DEBUG("Configuration: {}", tempo::to_json_string(config));

    tempo::ptp::Supervisor supervisor(config, tempo::ptp::Supervisor::default_dependencies(config));
    if (const auto started = supervisor.start(); !started) {
        TEMPO_CRITICAL("Failed to start: {}", to_string(started.error()));
        return started.error() == tempo::ptp::SupervisorError::invalid_config ? k_exit_invalid_config
                                                                              : k_exit_startup_failure;
    }

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, const int signal_number) {
        if (ec) {
            return;
        }
        TEMPO_INFO("Received signal {}", signal_number);
    });
    signal_context.run();

    supervisor.shutdown();
    TEMPO_INFO("Exit");
    return k_exit_ok;
}
