#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <rcache/client/connection.hpp>

namespace rcache {

    // Synchronous RESP connection over TCP. Each wait for the socket to become
    // readable or writable is bounded by the configured timeout; a timeout or
    // I/O error breaks the connection.
    class TcpConnection final : public Connection {
    public:
        TcpConnection(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
        ~TcpConnection() override;

        TcpConnection(const TcpConnection&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;

        RespValue execute(const CommandArgs& cmd) override;
        std::vector<RespValue> execute_batch(const std::vector<CommandArgs>& cmds) override;
        bool broken() const override { return broken_; }

        const std::string& endpoint() const { return endpoint_; }

    private:
        bool wait_ready(short events);
        void write_all(const std::string& bytes);
        RespValue read_reply();
        [[noreturn]] void fail(const std::string& what);

        asio::io_context io_;
        asio::ip::tcp::socket socket_;
        std::string endpoint_;
        std::chrono::milliseconds timeout_;
        std::string readbuf_;
        bool broken_ = false;
    };

} // namespace rcache
