#include "connector/http/PrintHttpServer.hpp"
#include "support/PipelineFixture.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <thread>

namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using connector::controllers::PrintController;
using connector::http::PrintHttpServer;
using connector::http::ServerLimits;
using core::device::TargetSpec;
using namespace std::chrono_literals;

class PrintHttpServerTest : public ::testing::Test {
protected:
    fakes::Pipeline pipeline;
    std::shared_ptr<PrintController> controller =
            std::make_shared<PrintController>(pipeline.coordinator(TargetSpec::serial("/dev/rfcomm0",
                                                                                       std::string("X6"))));
    std::unique_ptr<PrintHttpServer> server;

    void startServer(ServerLimits limits = ServerLimits()) {
        server = std::make_unique<PrintHttpServer>("127.0.0.1", 0, controller, limits);
        ASSERT_TRUE(server->start());
    }

    void TearDown() override {
        if (server) server->stop();
    }

    tcp::endpoint endpoint() const {
        return {boost::asio::ip::make_address("127.0.0.1"), server->boundPort()};
    }

    bhttp::response<bhttp::string_body> get(const std::string &target) {
        boost::asio::io_context io;
        tcp::socket socket(io);
        socket.connect(endpoint());

        bhttp::request<bhttp::string_body> request(bhttp::verb::get, target, 11);
        request.set(bhttp::field::host, "127.0.0.1");
        request.keep_alive(false);
        bhttp::write(socket, request);

        boost::beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> response;
        bhttp::read(socket, buffer, response);
        return response;
    }

    // Error the peer sees on its next read, or would_block if nothing arrived in time
    static boost::system::error_code nextReadError(boost::asio::io_context &io, tcp::socket &socket,
                                                   std::chrono::milliseconds within) {
        boost::system::error_code result = boost::asio::error::would_block;
        char byte;
        socket.async_read_some(boost::asio::buffer(&byte, 1),
                               [&result](const boost::system::error_code &ec, std::size_t) { result = ec; });
        io.restart();
        io.run_for(within);
        return result;
    }

    bool waitForSessions(size_t count) const {
        for (int i = 0; i < 200 && server->activeSessions() != count; ++i) {
            std::this_thread::sleep_for(5ms);
        }
        return server->activeSessions() == count;
    }
};

TEST_F(PrintHttpServerTest, ServesPrintRequestsAsPlainText) {
    startServer();

    auto response = get("/print?text=hello");

    EXPECT_EQ(response.result_int(), 200u);
    EXPECT_EQ(response.body(), "OK\n");
    EXPECT_EQ(response[bhttp::field::content_type], "text/plain; charset=utf-8");
    EXPECT_EQ(pipeline.transport->deliveries(), 1u);

    auto missing = get("/status");
    EXPECT_EQ(missing.result_int(), 404u);
}

TEST_F(PrintHttpServerTest, IdleClientIsDroppedAfterTheReadTimeout) {
    ServerLimits limits;
    limits.readTimeout = 150ms;
    startServer(limits);

    boost::asio::io_context io;
    tcp::socket idle(io);
    idle.connect(endpoint());
    ASSERT_TRUE(waitForSessions(1));

    auto ec = nextReadError(io, idle, 3000ms);
    EXPECT_NE(ec, boost::asio::error::would_block);
    EXPECT_TRUE(ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset) << ec.message();
    EXPECT_TRUE(waitForSessions(0));
}

TEST_F(PrintHttpServerTest, StopClosesOpenConnections) {
    startServer();

    boost::asio::io_context io;
    tcp::socket idle(io);
    idle.connect(endpoint());
    ASSERT_TRUE(waitForSessions(1));

    auto start = std::chrono::steady_clock::now();
    server->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);

    auto ec = nextReadError(io, idle, 2000ms);
    EXPECT_NE(ec, boost::asio::error::would_block);
    EXPECT_FALSE(server->isRunning());
}

TEST_F(PrintHttpServerTest, StopWaitsForTheJobInFlight) {
    std::promise<void> started;
    std::atomic<bool> finished{false};
    pipeline.transport->hook = [&started, &finished](const core::types::Deadline &) {
        started.set_value();
        std::this_thread::sleep_for(200ms);
        finished = true;
    };
    startServer();

    std::thread client([this]() {
        boost::asio::io_context io;
        tcp::socket socket(io);
        boost::system::error_code ec;
        socket.connect(endpoint(), ec);
        bhttp::request<bhttp::string_body> request(bhttp::verb::get, "/print?text=slow", 11);
        request.set(bhttp::field::host, "127.0.0.1");
        bhttp::write(socket, request, ec);
        boost::beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> response;
        bhttp::read(socket, buffer, response, ec);
    });

    ASSERT_EQ(started.get_future().wait_for(2s), std::future_status::ready);
    server->stop();

    EXPECT_TRUE(finished.load());
    client.join();
}

TEST_F(PrintHttpServerTest, ConnectionsBeyondTheCapAreRefused) {
    ServerLimits limits;
    limits.maxSessions = 1;
    startServer(limits);

    boost::asio::io_context io;
    tcp::socket first(io);
    first.connect(endpoint());
    ASSERT_TRUE(waitForSessions(1));

    tcp::socket second(io);
    second.connect(endpoint());
    auto ec = nextReadError(io, second, 2000ms);
    EXPECT_NE(ec, boost::asio::error::would_block);
    EXPECT_EQ(server->activeSessions(), 1u);
}
