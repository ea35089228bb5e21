#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <rcache/core/router.hpp>
#include <rcache/proto/resp.hpp>

namespace rcache {

	// One client connection. Frames are dispatched in arrival order on the
	// session strand so MULTI/EXEC queues see commands as the client sent them.
	class Session : public std::enable_shared_from_this<Session> {
	public:
		Session(asio::ip::tcp::socket sock, EmbeddedStore& store);
		void start();

	private:
		void do_read();
		void do_write();
		void enqueue_write(std::string msg);
		void handle_frame(const std::vector<std::string>& args);

		asio::ip::tcp::socket socket_;
		asio::strand<asio::any_io_executor> strand_;
		std::vector<char> inbuf_;
		std::string pending_;
		std::deque<std::string> outq_;
		bool closing_ = false;   // protocol error: flush then hang up

		EmbeddedStore& store_;
		ClientState client_;
	};

} // namespace rcache
