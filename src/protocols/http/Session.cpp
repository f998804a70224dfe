#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "logging/LogRegistry.hpp"

using namespace sm::logging;

namespace sm::protocols::http {

Session::Session(tcp::socket socket, std::shared_ptr<Router> router, const uint64_t bodyLimit)
    : socket_(std::move(socket)), router_(std::move(router)), bodyLimit_(bodyLimit) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);
    parser_->header_limit(16 * 1024);

    auto self = shared_from_this();
    http::async_read(socket_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec == http::error::body_limit) {
        LogRegistry::http()->warn("[Session] Request body over {} bytes rejected", bodyLimit_);
        string_response res{status::payload_too_large, 11};
        res.set(field::content_type, "application/json");
        res.body() = R"({"success":false,"error":{"code":"invalid_request","message":"Request body too large"}})";
        res.prepare_payload();
        res.keep_alive(false);
        return send(std::move(res));
    }

    if (ec) {
        LogRegistry::http()->error("[Session] Read error: {}", ec.message());
        return do_close();
    }

    auto req = parser_->release();
    LogRegistry::http()->debug("[Session] Read {} bytes: {} {}", bytes, std::string(req.method_string()),
                               std::string(req.target()));

    try {
        send(router_->route(std::move(req)));
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[Session] Exception during request handling: {}", e.what());

        string_response err{status::internal_server_error, 11};
        err.set(field::content_type, "text/plain");
        err.body() = "Internal server error";
        err.prepare_payload();
        err.keep_alive(false);
        send(std::move(err));
    }
}

template <class Response>
void Session::send(Response&& res) {
    auto self = shared_from_this();
    auto msg = std::make_shared<std::decay_t<Response>>(std::forward<Response>(res));
    const bool close = msg->need_eof();
    http::async_write(socket_, *msg,
                      [self, msg, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes;

    if (ec) {
        LogRegistry::http()->error("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
