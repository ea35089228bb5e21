#include <rcache/codec/codec.hpp>
#include <rcache/util/errors.hpp>
#include <cstdint>
#include <cstring>
#include <vector>
#include <zlib.h>

namespace rcache {

    std::string ValueCodec::encode(const Value& value) const {
        if (value.is_discarded()) {
            throw SerializationError("cannot serialize a discarded value");
        }

        std::vector<std::uint8_t> packed;
        try {
            packed = Value::to_msgpack(value);
        }
        catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::string("msgpack encode failed: ") + e.what());
        }
        if (packed.size() > kMaxPayloadBytes) {
            throw SerializationError("value too large to cache: " + std::to_string(packed.size()) + " bytes");
        }

        std::string out;
        auto n = static_cast<std::uint32_t>(packed.size());
        out.push_back(static_cast<char>((n >> 24) & 0xFF));
        out.push_back(static_cast<char>((n >> 16) & 0xFF));
        out.push_back(static_cast<char>((n >> 8) & 0xFF));
        out.push_back(static_cast<char>(n & 0xFF));
        out += compress(std::string(packed.begin(), packed.end()));
        return out;
    }

    Value ValueCodec::decode(std::string_view raw) const {
        if (raw.size() < 4) {
            throw SerializationError("encoded value shorter than its header");
        }
        auto b = reinterpret_cast<const unsigned char*>(raw.data());
        std::size_t expected = (static_cast<std::size_t>(b[0]) << 24) | (static_cast<std::size_t>(b[1]) << 16) |
            (static_cast<std::size_t>(b[2]) << 8) | static_cast<std::size_t>(b[3]);
        if (expected > kMaxPayloadBytes) {
            throw SerializationError("encoded value declares an implausible length");
        }

        auto packed = decompress(raw.substr(4), expected);
        try {
            return Value::from_msgpack(packed.begin(), packed.end());
        }
        catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::string("msgpack decode failed: ") + e.what());
        }
    }

    std::string ValueCodec::compress(const std::string& data) {
        z_stream zs;
        std::memset(&zs, 0, sizeof(zs));

        // speed over ratio; values are small and read far more than written
        if (deflateInit(&zs, Z_BEST_SPEED) != Z_OK) {
            throw SerializationError("failed to initialize zlib deflate");
        }

        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        zs.avail_in = static_cast<uInt>(data.size());

        int ret;
        char outbuffer[kBufferSize];
        std::string compressed;

        do {
            zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
            zs.avail_out = kBufferSize;

            ret = deflate(&zs, Z_FINISH);

            if (compressed.size() < zs.total_out) {
                compressed.append(outbuffer, zs.total_out - compressed.size());
            }
        } while (ret == Z_OK);

        deflateEnd(&zs);
        if (ret != Z_STREAM_END) {
            throw SerializationError("zlib deflate failed");
        }
        return compressed;
    }

    std::string ValueCodec::decompress(std::string_view data, std::size_t expected) {
        z_stream zs;
        std::memset(&zs, 0, sizeof(zs));
        if (inflateInit(&zs) != Z_OK) {
            throw SerializationError("failed to initialize zlib inflate");
        }

        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        zs.avail_in = static_cast<uInt>(data.size());

        int ret;
        char outbuffer[kBufferSize];
        std::string out;
        out.reserve(expected);

        do {
            zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
            zs.avail_out = kBufferSize;

            ret = inflate(&zs, Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
                break;
            }
            out.append(outbuffer, kBufferSize - zs.avail_out);
            if (out.size() > expected) break;
            // input exhausted without reaching stream end
            if (ret == Z_BUF_ERROR || (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)) break;
        } while (ret != Z_STREAM_END);

        inflateEnd(&zs);
        if (ret != Z_STREAM_END) {
            throw SerializationError("corrupt compressed value");
        }
        if (out.size() != expected) {
            throw SerializationError("decompressed length does not match header");
        }
        return out;
    }

} // namespace rcache
