#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio.hpp>

#include <cstdint>
#include <memory>

namespace sm::protocols::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

// Accepts connections for the source read API. Sessions run on the acceptor's io_context.
class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<Router> router, uint64_t bodyLimit);

    void run();
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::shared_ptr<Router> router_;
    uint64_t bodyLimit_;
};

}
