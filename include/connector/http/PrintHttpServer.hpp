//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include "connector/controllers/PrintController.hpp"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

namespace connector::http {

    struct ServerLimits {
        // Budget for a whole request (headers and body) and for writing the reply
        std::chrono::milliseconds readTimeout{30000};
        std::chrono::milliseconds writeTimeout{30000};
        // Connections beyond this are closed right after accept
        size_t maxSessions = 64;
        // Threads running controller calls, which block while a job prints
        size_t handlerThreads = 4;
    };

    /**
     * @brief HTTP/1.1 endpoint on Boost.Beast.
     *
     * Sessions are asynchronous on a single I/O thread, with a timeout on every read
     * and write. Requests are handed to a small handler pool so a printing job never
     * stalls other connections; printing itself is serialized by the coordinator.
     * stop() closes every open connection and waits for in-flight requests.
     */
    class PrintHttpServer {
    public:
        PrintHttpServer(std::string host, unsigned short port,
                        std::shared_ptr<controllers::PrintController> controller,
                        ServerLimits limits = ServerLimits());

        ~PrintHttpServer();

        /**
         * @return false if the address cannot be bound.
         */
        bool start();

        void stop();

        bool isRunning() const;

        /**
         * @brief Actual listening port, useful when started on port 0.
         */
        unsigned short boundPort() const;

        size_t activeSessions() const;

    private:
        class Session;
        struct Registry;

        std::string host_;
        unsigned short port_;
        std::shared_ptr<controllers::PrintController> controller_;
        ServerLimits limits_;

        std::shared_ptr<Registry> registry_;
        std::shared_ptr<boost::asio::thread_pool> handlers_;
        std::unique_ptr<boost::asio::io_context> ioContext_;
        std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
        std::thread ioThread_;
        std::atomic<bool> running_{false};
        unsigned short boundPort_ = 0;

        void doAccept();

        void closeAll();
    };

} // namespace connector::http
