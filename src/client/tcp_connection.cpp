#include <rcache/client/tcp_connection.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>
#include <cerrno>
#include <cstring>
#include <exception>
#include <poll.h>

using asio::ip::tcp;

namespace rcache {

    static bool would_block(const asio::error_code& ec) {
        return ec == asio::error::would_block || ec == asio::error::try_again;
    }

    TcpConnection::TcpConnection(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
        : socket_(io_)
        , endpoint_(host + ":" + std::to_string(port))
        , timeout_(timeout) {
        asio::error_code ec;
        tcp::resolver res(io_);
        auto eps = res.resolve(host, std::to_string(port), ec);
        if (ec) fail("resolve " + endpoint_ + ": " + ec.message());
        asio::connect(socket_, eps, ec);
        if (ec) fail("connect " + endpoint_ + ": " + ec.message());
        socket_.set_option(tcp::no_delay(true), ec);
        // I/O is bounded by poll() below rather than by blocking calls
        socket_.non_blocking(true, ec);
        if (ec) fail("non-blocking mode on " + endpoint_ + ": " + ec.message());
        log::debugf("tcp", "connected to {}", endpoint_);
    }

    TcpConnection::~TcpConnection() {
        asio::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void TcpConnection::fail(const std::string& what) {
        broken_ = true;
        throw StoreUnavailable(what);
    }

    bool TcpConnection::wait_ready(short events) {
        pollfd pfd{};
        pfd.fd = socket_.native_handle();
        pfd.events = events;
        int ms = timeout_.count() > 0 ? static_cast<int>(timeout_.count()) : -1;
        int rc;
        do {
            rc = ::poll(&pfd, 1, ms);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) fail("poll on " + endpoint_ + ": " + std::strerror(errno));
        return rc > 0;
    }

    void TcpConnection::write_all(const std::string& bytes) {
        if (broken_) fail("connection to " + endpoint_ + " is broken");
        std::size_t off = 0;
        while (off < bytes.size()) {
            asio::error_code ec;
            std::size_t n = socket_.write_some(asio::buffer(bytes.data() + off, bytes.size() - off), ec);
            if (would_block(ec)) {
                if (!wait_ready(POLLOUT)) fail("write to " + endpoint_ + " timed out");
                continue;
            }
            if (ec) fail("write to " + endpoint_ + ": " + ec.message());
            off += n;
        }
    }

    RespValue TcpConnection::read_reply() {
        for (;;) {
            if (!readbuf_.empty()) {
                RespReplyResult res;
                try {
                    res = parse_reply(readbuf_.data(), readbuf_.size());
                }
                catch (const std::exception& e) {
                    fail(std::string("unreadable reply from ") + endpoint_ + ": " + e.what());
                }
                if (res.value) {
                    readbuf_.erase(0, res.consumed);
                    return std::move(*res.value);
                }
                if (!res.error.empty()) fail(res.error + " from " + endpoint_);
            }
            char tmp[4096];
            asio::error_code ec;
            std::size_t n = socket_.read_some(asio::buffer(tmp), ec);
            if (would_block(ec)) {
                if (!wait_ready(POLLIN)) fail("read from " + endpoint_ + " timed out");
                continue;
            }
            if (ec) fail("read from " + endpoint_ + ": " + ec.message());
            readbuf_.append(tmp, tmp + n);
        }
    }

    RespValue TcpConnection::execute(const CommandArgs& cmd) {
        write_all(encode_command(cmd));
        return read_reply();
    }

    std::vector<RespValue> TcpConnection::execute_batch(const std::vector<CommandArgs>& cmds) {
        std::string out;
        for (auto& c : cmds) out += encode_command(c);
        write_all(out);

        std::vector<RespValue> replies;
        replies.reserve(cmds.size());
        for (size_t i = 0; i < cmds.size(); ++i) replies.push_back(read_reply());
        return replies;
    }

} // namespace rcache
