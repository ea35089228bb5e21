#include <rcache/client/local_connection.hpp>
#include <rcache/util/errors.hpp>

namespace rcache {

    RespValue LocalConnection::execute(const CommandArgs& cmd) {
        auto wire = store_.router.dispatch(state_, cmd);
        auto res = parse_reply(wire.data(), wire.size());
        if (!res.value) {
            throw StoreUnavailable("embedded store produced an unreadable reply: " + res.error);
        }
        return std::move(*res.value);
    }

    std::vector<RespValue> LocalConnection::execute_batch(const std::vector<CommandArgs>& cmds) {
        std::vector<RespValue> replies;
        replies.reserve(cmds.size());
        for (auto& c : cmds) replies.push_back(execute(c));
        return replies;
    }

} // namespace rcache
