#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "logging/LogRegistry.hpp"

using namespace sm::logging;

namespace sm::protocols::http {

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<Router> router,
               const uint64_t bodyLimit)
    : acceptor_(ioc), socket_(ioc), router_(std::move(router)), bodyLimit_(bodyLimit) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void Server::run() {
    const auto ep = acceptor_.local_endpoint();
    LogRegistry::http()->info("[Server] Serving migration source API on {}:{}", ep.address().to_string(), ep.port());
    do_accept();
}

void Server::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) LogRegistry::http()->warn("[Server] Error closing acceptor: {}", ec.message());
}

void Server::do_accept() {
    acceptor_.async_accept(socket_, [self = shared_from_this()](beast::error_code ec) mutable {
        if (ec == net::error::operation_aborted) return;

        if (!ec) std::make_shared<Session>(std::move(self->socket_), self->router_, self->bodyLimit_)->run();
        else LogRegistry::http()->warn("[Server] Accept failed: {}", ec.message());

        self->do_accept();
    });
}

}
