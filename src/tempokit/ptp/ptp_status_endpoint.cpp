/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "tempokit/ptp/ptp_status_endpoint.hpp"

#include "tempokit/core/json.hpp"
#include "tempokit/core/log.hpp"
#include "tempokit/core/string.hpp"
#include "tempokit/core/tracy.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace {

using stream_protocol = boost::asio::local::stream_protocol;

/**
 * One client connection: read one line, write one response, close.
 */
class Session: public std::enable_shared_from_this<Session> {
  public:
    Session(
        stream_protocol::socket socket, tempo::ptp::StatusSource& source,
        const tempo::ptp::StatusEndpointConfig& config
    ) :
        socket_(std::move(socket)),
        deadline_(socket_.get_executor()),
        buffer_(tempo::ptp::StatusEndpoint::k_max_request_size),
        source_(source),
        config_(config) {}

    void start() {
        deadline_.expires_after(config_.request_timeout);
        deadline_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                TEMPO_DEBUG("Status client did not send a request in time");
                self->close();
            }
        });

        boost::asio::async_read_until(
            socket_, buffer_, '\n',
            [self = shared_from_this()](const boost::system::error_code& ec, const size_t length) {
                self->on_read(ec, length);
            }
        );
    }

    void close() {
        deadline_.cancel();
        if (!socket_.is_open()) {
            return;
        }
        boost::system::error_code ec;
        socket_.shutdown(stream_protocol::socket::shutdown_both, ec);
        if (ec && ec != boost::asio::error::not_connected) {
            TEMPO_TRACE("Status client shutdown: {}", ec.message());
        }
        socket_.close(ec);
        if (ec) {
            TEMPO_TRACE("Status client close: {}", ec.message());
        }
    }

  private:
    stream_protocol::socket socket_;
    boost::asio::steady_timer deadline_;
    boost::asio::streambuf buffer_;
    std::string response_;
    tempo::ptp::StatusSource& source_;
    tempo::ptp::StatusEndpointConfig config_;

    void on_read(const boost::system::error_code& ec, size_t length) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        deadline_.cancel();

        if (ec == boost::asio::error::not_found) {
            respond(R"({"error":"request too long"})");
            return;
        }

        if (ec && ec != boost::asio::error::eof) {
            TEMPO_DEBUG("Status client read failed: {}", ec.message());
            close();
            return;
        }

        if (ec == boost::asio::error::eof) {
            length = buffer_.size();  // Request without line ending.
        }

        const auto begin = boost::asio::buffers_begin(buffer_.data());
        std::string request(begin, begin + static_cast<std::ptrdiff_t>(length));
        buffer_.consume(length);

        if (tempo::string_trim(request).empty()) {
            close();
            return;
        }

        respond(tempo::ptp::StatusEndpoint::handle_request(request, source_, config_.snapshot_timeout));
    }

    void respond(std::string response) {
        response_ = std::move(response);
        response_.push_back('\n');
        boost::asio::async_write(
            socket_, boost::asio::buffer(response_),
            [self = shared_from_this()](const boost::system::error_code& ec, size_t) {
                if (ec && ec != boost::asio::error::operation_aborted) {
                    TEMPO_DEBUG("Status client write failed: {}", ec.message());
                }
                self->close();
            }
        );
    }
};

}  // namespace

class tempo::ptp::StatusEndpoint::Impl: public std::enable_shared_from_this<Impl> {
  public:
    Impl(boost::asio::io_context& io_context, StatusSource& source, StatusEndpointConfig config) :
        strand_(boost::asio::make_strand(io_context)), acceptor_(strand_), source_(source), config_(std::move(config)) {}

    tl::expected<void, boost::system::error_code> start() {
        if (::unlink(config_.socket_path.c_str()) == 0) {
            TEMPO_DEBUG("Removed stale status socket {}", config_.socket_path);
        } else if (errno != ENOENT) {
            TEMPO_WARNING("Failed to remove {}: {}", config_.socket_path, std::strerror(errno));
        }

        const stream_protocol::endpoint endpoint(config_.socket_path);

        boost::system::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            return tl::unexpected(ec);
        }
        acceptor_.bind(endpoint, ec);
        if (ec) {
            return tl::unexpected(ec);
        }
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            return tl::unexpected(ec);
        }

        TEMPO_INFO("Serving status on {}", config_.socket_path);
        async_accept();
        return {};
    }

    void stop() {
        if (stopped_.exchange(true)) {
            return;
        }

        boost::asio::dispatch(strand_, [self = shared_from_this()] {
            boost::system::error_code ec;
            self->acceptor_.close(ec);
            if (ec) {
                TEMPO_WARNING("Failed to close status socket: {}", ec.message());
            }
            for (auto& weak : self->sessions_) {
                if (auto session = weak.lock()) {
                    session->close();
                }
            }
            self->sessions_.clear();
        });

        if (::unlink(config_.socket_path.c_str()) != 0 && errno != ENOENT) {
            TEMPO_WARNING("Failed to remove {}: {}", config_.socket_path, std::strerror(errno));
        }
    }

  private:
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    stream_protocol::acceptor acceptor_;
    StatusSource& source_;
    StatusEndpointConfig config_;
    std::vector<std::weak_ptr<Session>> sessions_;
    std::atomic_bool stopped_ {};

    void async_accept() {
        acceptor_.async_accept([weak = weak_from_this()](
                                   const boost::system::error_code& ec, stream_protocol::socket socket
                               ) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }

            auto self = weak.lock();
            if (self == nullptr) {
                return;
            }

            if (ec) {
                TEMPO_ERROR("Failed to accept status client: {}", ec.message());
            } else {
                TRACY_ZONE_SCOPED;
                auto session = std::make_shared<Session>(std::move(socket), self->source_, self->config_);
                session->start();

                self->sessions_.erase(
                    std::remove_if(
                        self->sessions_.begin(), self->sessions_.end(),
                        [](const std::weak_ptr<Session>& s) {
                            return s.expired();
                        }
                    ),
                    self->sessions_.end()
                );
                self->sessions_.push_back(session);
            }

            if (self->acceptor_.is_open()) {
                self->async_accept();
            }
        });
    }
};

tempo::ptp::StatusEndpoint::StatusEndpoint(
    boost::asio::io_context& io_context, StatusSource& source, StatusEndpointConfig config
) :
    impl_(std::make_shared<Impl>(io_context, source, std::move(config))) {}

tempo::ptp::StatusEndpoint::~StatusEndpoint() {
    impl_->stop();
}

tl::expected<void, boost::system::error_code> tempo::ptp::StatusEndpoint::start() {
    return impl_->start();
}

void tempo::ptp::StatusEndpoint::stop() {
    impl_->stop();
}

std::string tempo::ptp::StatusEndpoint::handle_request(
    const std::string_view request, StatusSource& source, const std::chrono::milliseconds timeout
) {
    const auto command = string_trim(request);

    if (command == "status") {
        return boost::json::serialize(
            boost::json::object {
                {"ports", boost::json::value_from(source.get_port_states(timeout))},
                {"clock", boost::json::value_from(source.get_clock_state(timeout))},
            }
        );
    }

    if (command == "ports") {
        return boost::json::serialize(
            boost::json::object {{"ports", boost::json::value_from(source.get_port_states(timeout))}}
        );
    }

    if (command == "clock") {
        return boost::json::serialize(
            boost::json::object {{"clock", boost::json::value_from(source.get_clock_state(timeout))}}
        );
    }

    return boost::json::serialize(boost::json::object {{"error", fmt::format("unknown request: {}", command)}});
}
