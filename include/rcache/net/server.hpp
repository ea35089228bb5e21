#pragma once
#include <asio.hpp>
#include <cstdint>
#include <rcache/core/router.hpp>

namespace rcache {

	// RESP2 TCP front end of an EmbeddedStore. Port 0 binds an ephemeral port.
	class Server {
	public:
		Server(asio::io_context& io, uint16_t port, EmbeddedStore& store);

		uint16_t local_port() const;
		void close();

	private:
		void accept();
		asio::ip::tcp::acceptor acceptor_;
		EmbeddedStore& store_;
	};

} // namespace rcache
