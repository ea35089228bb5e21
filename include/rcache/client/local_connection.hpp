#pragma once
#include <rcache/client/connection.hpp>
#include <rcache/core/router.hpp>

namespace rcache {

    // In-process connection to an EmbeddedStore. Commands go through the same
    // router and RESP encoding the TCP server uses, so WATCH/MULTI behave the
    // same way; there is no transport, hence nothing ever breaks.
    class LocalConnection final : public Connection {
    public:
        explicit LocalConnection(EmbeddedStore& store) : store_(store) {}

        RespValue execute(const CommandArgs& cmd) override;
        std::vector<RespValue> execute_batch(const std::vector<CommandArgs>& cmds) override;
        bool broken() const override { return false; }

    private:
        EmbeddedStore& store_;
        ClientState state_;
    };

} // namespace rcache
