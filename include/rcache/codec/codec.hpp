#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace rcache {

    // Values cached by a region: any JSON-representable object graph.
    using Value = nlohmann::json;

    // MessagePack serialization followed by fast zlib deflate. Wire layout:
    //
    //   [4-byte big-endian uncompressed length][zlib stream]
    //
    // Both directions throw SerializationError.
    class ValueCodec {
    public:
        std::string encode(const Value& value) const;
        Value decode(std::string_view raw) const;

        // Payloads above this size are rejected on decode as corrupt.
        static constexpr std::size_t kMaxPayloadBytes = 512u * 1024u * 1024u;

    private:
        static std::string compress(const std::string& data);
        static std::string decompress(std::string_view data, std::size_t expected);

        static constexpr std::size_t kBufferSize = 32768;
    };

    // Region names and keys travel as their plain bytes.
    class StringCodec {
    public:
        std::string encode(std::string_view s) const { return std::string(s); }
        std::string decode(std::string_view raw) const { return std::string(raw); }
    };

    // Stable string form of a logical cache key.
    template <typename K>
    std::string key_of(const K& key) {
        return fmt::format("{}", key);
    }

    inline std::string key_of(const std::string& key) { return key; }
    inline std::string key_of(const Value& key) { return key.is_string() ? key.get<std::string>() : key.dump(); }

} // namespace rcache
