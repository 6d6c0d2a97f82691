//
// Created by Andrea on 18/10/2025.
//

#include "connector/http/PrintHttpServer.hpp"
#include "logger/Logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace connector::http {

    struct PrintHttpServer::Registry {
        mutable std::mutex mutex;
        std::map<uint64_t, std::weak_ptr<Session>> sessions;
        uint64_t nextId = 0;

        uint64_t add(std::weak_ptr<Session> session) {
            std::lock_guard<std::mutex> lock(mutex);
            const uint64_t id = ++nextId;
            sessions.emplace(id, std::move(session));
            return id;
        }

        void remove(uint64_t id) {
            std::lock_guard<std::mutex> lock(mutex);
            sessions.erase(id);
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex);
            return sessions.size();
        }

        std::vector<std::shared_ptr<Session>> snapshot() const {
            std::lock_guard<std::mutex> lock(mutex);
            std::vector<std::shared_ptr<Session>> live;
            for (const auto &entry: sessions) {
                if (auto session = entry.second.lock()) {
                    live.push_back(std::move(session));
                }
            }
            return live;
        }
    };

    class PrintHttpServer::Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket,
                std::shared_ptr<controllers::PrintController> controller,
                std::shared_ptr<boost::asio::thread_pool> handlers,
                std::shared_ptr<Registry> registry,
                const ServerLimits &limits)
            : stream_(std::move(socket)), controller_(std::move(controller)), handlers_(std::move(handlers)),
              registry_(std::move(registry)), limits_(limits) {
            boost::system::error_code ec;
            auto remote = stream_.socket().remote_endpoint(ec);
            if (!ec) peer_ = remote.address().to_string() + ":" + std::to_string(remote.port());
        }

        ~Session() {
            if (id_ != 0) {
                registry_->remove(id_);
            }
        }

        void run() {
            id_ = registry_->add(weak_from_this());
            readRequest();
        }

        // Must run on the I/O thread
        void cancel() {
            boost::system::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            stream_.close();
        }

    private:
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
        bhttp::response<bhttp::string_body> response_;
        std::shared_ptr<controllers::PrintController> controller_;
        std::shared_ptr<boost::asio::thread_pool> handlers_;
        std::shared_ptr<Registry> registry_;
        ServerLimits limits_;
        std::string peer_ = "unknown";
        uint64_t id_ = 0;

        void readRequest() {
            parser_.emplace();
            parser_->body_limit(controller_->maxBodyBytes());

            stream_.expires_after(limits_.readTimeout);
            bhttp::async_read(stream_, buffer_, *parser_,
                              [self = shared_from_this()](const beast::error_code &ec, std::size_t) {
                                  self->onRead(ec);
                              });
        }

        void onRead(const beast::error_code &ec) {
            if (ec == bhttp::error::end_of_stream) {
                closeGracefully();
                return;
            }
            if (ec == bhttp::error::body_limit) {
                respond(static_cast<unsigned>(bhttp::status::payload_too_large),
                        "Request body too large (max " + std::to_string(controller_->maxBodyBytes()) +
                        " bytes).\n", 11, false);
                return;
            }
            if (ec == beast::error::timeout) {
                Logger::logDebug("[PrintHttpServer] " + peer_ + " idle, closing");
                return;
            }
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    Logger::logDebug("[PrintHttpServer] " + peer_ + " read failed: " + ec.message());
                }
                return;
            }

            auto request = parser_->release();
            const auto methodView = request.method_string();
            const auto targetView = request.target();
            std::string method(methodView.data(), methodView.size());
            std::string target(targetView.data(), targetView.size());
            const unsigned version = request.version();
            const bool keepAlive = request.keep_alive();
            Logger::logInfo("[PrintHttpServer] " + peer_ + " " + method + " " + target);

            // No read timeout while the job runs
            stream_.expires_never();
            boost::asio::post(*handlers_, [self = shared_from_this(), method = std::move(method),
                                           target = std::move(target), body = std::move(request.body()),
                                           version, keepAlive]() {
                controllers::HttpReply reply;
                try {
                    reply = self->controller_->handle(method, target, body);
                } catch (const std::exception &e) {
                    Logger::logError("[PrintHttpServer] Handler failed: " + std::string(e.what()));
                    reply = {500, "Print error - check server logs.\n"};
                }
                boost::asio::post(self->stream_.get_executor(),
                                  [self, reply = std::move(reply), version, keepAlive]() mutable {
                                      self->respond(static_cast<unsigned>(reply.status), std::move(reply.body),
                                                    version, keepAlive);
                                  });
            });
        }

        void respond(unsigned status, std::string body, unsigned version, bool keepAlive) {
            response_ = {};
            response_.version(version);
            response_.result(status);
            response_.set(bhttp::field::server, BOOST_BEAST_VERSION_STRING);
            response_.set(bhttp::field::content_type, "text/plain; charset=utf-8");
            response_.keep_alive(keepAlive);
            response_.body() = std::move(body);
            response_.prepare_payload();

            stream_.expires_after(limits_.writeTimeout);
            bhttp::async_write(stream_, response_,
                               [self = shared_from_this(), keepAlive](const beast::error_code &ec, std::size_t) {
                                   self->onWrite(ec, keepAlive);
                               });
        }

        void onWrite(const beast::error_code &ec, bool keepAlive) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    Logger::logDebug("[PrintHttpServer] " + peer_ + " write failed: " + ec.message());
                }
                return;
            }
            if (!keepAlive) {
                closeGracefully();
                return;
            }
            readRequest();
        }

        void closeGracefully() {
            boost::system::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    };

    PrintHttpServer::PrintHttpServer(std::string host, unsigned short port,
                                     std::shared_ptr<controllers::PrintController> controller,
                                     ServerLimits limits)
        : host_(std::move(host)), port_(port), controller_(std::move(controller)), limits_(limits),
          registry_(std::make_shared<Registry>()) {
        if (!controller_) {
            throw std::invalid_argument("PrintController cannot be null");
        }
        if (limits_.handlerThreads == 0) {
            limits_.handlerThreads = 1;
        }
    }

    PrintHttpServer::~PrintHttpServer() {
        stop();
    }

    bool PrintHttpServer::start() {
        if (running_) {
            Logger::logWarning("[PrintHttpServer] Already running");
            return true;
        }

        try {
            ioContext_ = std::make_unique<boost::asio::io_context>();
            auto address = boost::asio::ip::make_address(host_);
            tcp::endpoint endpoint(address, port_);

            acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);
            acceptor_->open(endpoint.protocol());
            acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
            acceptor_->bind(endpoint);
            acceptor_->listen(boost::asio::socket_base::max_listen_connections);
            boundPort_ = acceptor_->local_endpoint().port();
        } catch (const boost::system::system_error &e) {
            Logger::logError("[PrintHttpServer] Cannot listen on " + host_ + ":" + std::to_string(port_) +
                             ": " + e.what());
            acceptor_.reset();
            ioContext_.reset();
            return false;
        }

        handlers_ = std::make_shared<boost::asio::thread_pool>(limits_.handlerThreads);
        running_ = true;
        doAccept();
        ioThread_ = std::thread([context = ioContext_.get()]() {
            context->run();
        });

        Logger::logInfo("[PrintHttpServer] Listening on http://" + host_ + ":" + std::to_string(boundPort_) +
                        "/print");
        return true;
    }

    void PrintHttpServer::stop() {
        if (!running_.exchange(false)) return;

        // Stop accepting and drop every connection, on the I/O thread that owns them
        std::promise<void> closed;
        boost::asio::post(*ioContext_, [this, &closed]() {
            closeAll();
            closed.set_value();
        });
        closed.get_future().wait();

        // Requests already handed to the pool run to completion
        handlers_->join();

        ioContext_->stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        acceptor_.reset();
        ioContext_.reset();
        handlers_.reset();

        Logger::logInfo("[PrintHttpServer] Stopped");
    }

    void PrintHttpServer::closeAll() {
        boost::system::error_code ec;
        acceptor_->close(ec);
        for (auto &session: registry_->snapshot()) {
            session->cancel();
        }
    }

    bool PrintHttpServer::isRunning() const {
        return running_;
    }

    unsigned short PrintHttpServer::boundPort() const {
        return boundPort_;
    }

    size_t PrintHttpServer::activeSessions() const {
        return registry_->size();
    }

    void PrintHttpServer::doAccept() {
        acceptor_->async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    Logger::logWarning("[PrintHttpServer] Accept failed: " + ec.message());
                }
            } else if (registry_->size() >= limits_.maxSessions) {
                Logger::logWarning("[PrintHttpServer] " + std::to_string(limits_.maxSessions) +
                                   " connections open, refusing another");
                boost::system::error_code ignored;
                socket.close(ignored);
            } else {
                std::make_shared<Session>(std::move(socket), controller_, handlers_, registry_, limits_)->run();
            }

            if (running_ && acceptor_->is_open()) {
                doAccept();
            }
        });
    }

} // namespace connector::http
