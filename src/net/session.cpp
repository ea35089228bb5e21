#include <rcache/net/session.hpp>
#include <rcache/util/log.hpp>
#include <asio/bind_executor.hpp>
#include <asio/write.hpp>

using asio::ip::tcp;

namespace rcache {

    Session::Session(tcp::socket sock, EmbeddedStore& store)
        : socket_(std::move(sock))
        , strand_(asio::make_strand(socket_.get_executor()))
        , store_(store) {
        inbuf_.resize(8 * 1024);
    }

    void Session::start() {
        asio::post(strand_, [self = shared_from_this()] { self->do_read(); });
    }

    void Session::do_read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(inbuf_),
            asio::bind_executor(strand_, [this, self](std::error_code ec, std::size_t n) {
                if (ec) return;
                pending_.append(inbuf_.data(), n);

                for (;;) {
                    auto res = parse_resp(pending_.data(), pending_.size());
                    if (!res.arr && res.error.empty()) break;       // need more
                    if (!res.error.empty()) {
                        log::debugf("session", "dropping client: {}", res.error);
                        enqueue_write(resp_error("Protocol error: " + res.error));
                        closing_ = true;
                        return;
                    }
                    auto args = std::move(res.arr->args);
                    pending_.erase(0, res.consumed);
                    handle_frame(args);
                }
                do_read();
            }));
    }

    void Session::handle_frame(const std::vector<std::string>& args) {
        std::string reply;
        try {
            reply = store_.router.dispatch(client_, args);
        }
        catch (const std::exception& e) {
            reply = resp_error(std::string("server error: ") + e.what());
        }
        enqueue_write(std::move(reply));
    }

    void Session::enqueue_write(std::string msg) {
        bool writing = !outq_.empty();
        outq_.push_back(std::move(msg));
        if (!writing) do_write();
    }

    void Session::do_write() {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outq_.front()),
            asio::bind_executor(strand_,
                [this, self](std::error_code ec, std::size_t) {
                    if (ec) return;
                    outq_.pop_front();
                    if (!outq_.empty()) {
                        do_write();
                    }
                    else if (closing_) {
                        asio::error_code ignored;
                        socket_.shutdown(tcp::socket::shutdown_both, ignored);
                        socket_.close(ignored);
                    }
                }));
    }

} // namespace rcache
