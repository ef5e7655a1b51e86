#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <functional>
#include <vector>

#include "errors.hpp"
#include "util/log.hpp"

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// One-shot HTTP/1.1 server: read a request, write the handler's response,
// close. Runs on the caller's io_context.
class HttpServer {
public:
    using HandlerFn = std::function<void(const http::request<http::string_body>&, http::response<http::string_body>&)>;

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler)
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)) {
        const std::string where = ep.address().to_string() + ":" + std::to_string(ep.port());
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw BindError("http " + where + ": open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw BindError("http " + where + ": set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw BindError("http " + where + ": bind: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw BindError("http " + where + ": listen: " + ec.message());
    }

    void run() { do_accept(); }

    // Stops accepting and drops connections still waiting for a request.
    // Requests already read are still answered.
    void stop() {
        stopped_ = true;
        boost::beast::error_code ec;
        acceptor_.close(ec);
        for (auto& w : sessions_) {
            if (auto s = w.lock()) {
                boost::asio::post(s->socket_.get_executor(), [s]{ s->drop_if_idle(); });
            }
        }
        sessions_.clear();
    }

    unsigned short port() const {
        boost::beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    struct Session : public std::enable_shared_from_this<Session> {
        tcp::socket socket_;
        boost::beast::flat_buffer buffer_;
        HttpServer::HandlerFn handler_;
        bool responding_ = false;
        Session(tcp::socket s, HandlerFn h) : socket_(std::move(s)), handler_(std::move(h)) {}
        void run() { do_read(); }
        void do_read() {
            auto self = shared_from_this();
            auto req = std::make_shared<http::request<http::string_body>>();
            http::async_read(socket_, buffer_, *req,
                [self, req](boost::beast::error_code ec, std::size_t){
                    if (ec == http::error::end_of_stream) return self->do_close();
                    if (ec) {
                        log_debug("http") << "read failed: " << ec.message();
                        return;
                    }
                    self->responding_ = true;
                    auto res = std::make_shared<http::response<http::string_body>>();
                    res->version(req->version());
                    res->keep_alive(false);
                    self->handler_(*req, *res);
                    res->set(http::field::access_control_allow_origin, "*");
                    res->set(http::field::access_control_allow_methods, "GET, OPTIONS");
                    if (req->method() == http::verb::options) {
                        res->result(http::status::ok);
                        res->set(http::field::content_type, "text/plain");
                        res->body() = "";
                    }
                    res->prepare_payload();
                    http::async_write(self->socket_, *res,
                        [self, res](boost::beast::error_code, std::size_t){
                            self->do_close();
                        });
                });
        }
        void do_close() {
            boost::beast::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_send, ec);
        }
        void drop_if_idle() {
            if (responding_) return;
            boost::beast::error_code ec;
            socket_.close(ec);
        }
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s){
                if (stopped_ || ec == boost::asio::error::operation_aborted) return;
                if (!ec) {
                    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                                   [](const std::weak_ptr<Session>& w) { return w.expired(); }),
                                    sessions_.end());
                    auto session = std::make_shared<Session>(std::move(s), handler_);
                    sessions_.push_back(session);
                    session->run();
                }
                else log_warn("http") << "accept failed: " << ec.message();
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
    std::vector<std::weak_ptr<Session>> sessions_;
    bool stopped_ = false;
};
