#pragma once
#include <string>
#include <vector>
#include <rcache/proto/resp.hpp>

namespace rcache {

    using CommandArgs = std::vector<std::string>;

    // One connection to the backing store. Not thread-safe: a connection is
    // used by one caller at a time through the pool.
    class Connection {
    public:
        virtual ~Connection() = default;

        // Send one command and wait for its reply. Transport failures throw
        // StoreUnavailable and leave the connection broken().
        virtual RespValue execute(const CommandArgs& cmd) = 0;

        // Send all commands in one write, then read one reply per command.
        virtual std::vector<RespValue> execute_batch(const std::vector<CommandArgs>& cmds) = 0;

        virtual bool broken() const = 0;
    };

} // namespace rcache
