#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <rcache/core/store.hpp>

namespace rcache {

    // Per-connection protocol state: optimistic watches and the MULTI queue.
    struct ClientState {
        bool in_multi = false;
        bool dirty = false;   // a command was rejected while queueing; EXEC must abort
        std::vector<std::vector<std::string>> queued;
        std::vector<std::pair<std::string, std::uint64_t>> watched;  // key, version at WATCH

        void reset_transaction() {
            in_multi = false;
            dirty = false;
            queued.clear();
            watched.clear();
        }
    };

    class Router {
    public:
        using Handler = std::function<std::string(const std::vector<std::string>&)>;
        explicit Router(Store& s);

        // Runs one command for a client and returns the encoded RESP reply.
        std::string dispatch(ClientState& client, const std::vector<std::string>& args);

    private:
        struct Command {
            int arity;        // exact argc when > 0, minimum argc when < 0
            Handler fn;
        };

        void add(const std::string& name, int arity, Handler fn);
        std::string invoke(const Command& c, const std::vector<std::string>& args);
        std::string exec(ClientState& client);

        Store& store_;
        std::unordered_map<std::string, Command> h_;
    };

    // A store plus the router serving it; what LocalConnection and the TCP server share.
    struct EmbeddedStore {
        explicit EmbeddedStore(size_t n_shards = 1) : store(n_shards), router(store) {}
        EmbeddedStore(const EmbeddedStore&) = delete;
        EmbeddedStore& operator=(const EmbeddedStore&) = delete;

        Store store;
        Router router;
    };

} // namespace rcache
