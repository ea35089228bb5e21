#include <rcache/net/server.hpp>
#include <rcache/net/session.hpp>
#include <rcache/util/log.hpp>
using asio::ip::tcp;

namespace rcache {

    Server::Server(asio::io_context& io, uint16_t port, EmbeddedStore& store)
        : acceptor_(io, tcp::endpoint(tcp::v4(), port))
        , store_(store) {
        accept();
    }

    uint16_t Server::local_port() const {
        return acceptor_.local_endpoint().port();
    }

    void Server::close() {
        asio::error_code ec;
        acceptor_.close(ec);
    }

    void Server::accept() {
        acceptor_.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) return;
            if (!ec) {
                std::make_shared<Session>(std::move(socket), store_)->start();
            }
            else {
                log::warnf("server", "accept failed: {}", ec.message());
            }
            accept();
            });
    }

} // namespace rcache
