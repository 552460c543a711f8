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

#include "tempokit/core/log.hpp"
#include "tempokit/core/tracy.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <string>
#include <thread>
#include <vector>

#if defined(__linux__)
    #include <pthread.h>
#endif

namespace tempo {

/**
 * Runs a boost::asio::io_context on a fixed number of threads. The threads keep running until stop() or join() is
 * called, also when there is no work.
 */
class IoContextRunner {
  public:
    /**
     * Constructs a runner and starts its threads.
     * @param num_threads Number of threads to run the io_context on. Must be at least 1.
     */
    explicit IoContextRunner(const size_t num_threads) :
        num_threads_(num_threads == 0 ? 1 : num_threads), io_context_(static_cast<int>(num_threads_)) {
        start();
    }

    ~IoContextRunner() {
        stop();
    }

    IoContextRunner(const IoContextRunner&) = delete;
    IoContextRunner& operator=(const IoContextRunner&) = delete;

    IoContextRunner(IoContextRunner&&) = delete;
    IoContextRunner& operator=(IoContextRunner&&) = delete;

    /**
     * Stops the io_context and waits for all threads to finish. Handlers which did not run yet are not run. Idempotent.
     */
    void stop() {
        io_context_.stop();
        join_threads();
    }

    /**
     * Releases the work guard and waits until the io_context ran out of work.
     */
    void join() {
        work_guard_.reset();
        join_threads();
    }

    /**
     * @return True if the runner threads are running.
     */
    [[nodiscard]] bool is_running() const {
        return !threads_.empty();
    }

    /**
     * @return The number of threads.
     */
    [[nodiscard]] size_t num_threads() const {
        return num_threads_;
    }

    /**
     * @return The io_context run by this runner.
     */
    boost::asio::io_context& io_context() {
        return io_context_;
    }

  private:
    const size_t num_threads_;
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_ {
        boost::asio::make_work_guard(io_context_)
    };
    std::vector<std::thread> threads_;

    void start() {
        threads_.reserve(num_threads_);

        for (size_t i = 0; i < num_threads_; i++) {
            threads_.emplace_back([this, i] {
                TRACY_ZONE_SCOPED;

#if defined(__linux__)
                {
                    // Thread names are limited to 15 characters on Linux.
                    const std::string thread_name = "tempo-io-" + std::to_string(i);
                    pthread_setname_np(pthread_self(), thread_name.c_str());
                }
#endif

                while (true) {
                    try {
                        io_context_.run();
                        break;
                    } catch (const std::exception& e) {
                        TEMPO_ERROR("Exception thrown on io_context runner thread: {}", e.what());
                    }
                }
            });
        }
    }

    void join_threads() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }
};

}  // namespace tempo
