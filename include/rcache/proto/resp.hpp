#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace rcache {

    // ---- server side: requests ------------------------------------------------

    // A full RESP2 frame parsed as an array of bulk strings,
    // which matches how clients send commands.
    struct RespArray { std::vector<std::string> args; };

    // Result of trying to parse from a byte buffer.
    struct RespParseResult {
        std::optional<RespArray> arr;  // present when a full frame was parsed
        std::string error;             // non-empty on protocol error
        std::size_t consumed = 0;      // how many bytes to erase from the buffer
    };

    // Parse exactly one RESP2 array frame from [data, data+len].
    // If incomplete, returns {arr=nullopt, error="", consumed=0}.
    // If protocol error, returns {arr=nullopt, error="...", consumed=bytes_to_drop_or_0}.
    // Requests with more arguments than this are rejected as protocol errors.
    constexpr long long kMaxRequestArgs = 1024 * 1024;

    RespParseResult parse_resp(const char* data, std::size_t len);

    // Emit helpers
    std::string resp_simple(const std::string& s);  // +OK\r\n
    std::string resp_error(const std::string& s);   // -ERR msg\r\n
    std::string resp_error_code(const std::string& code, const std::string& s); // -CODE msg\r\n
    std::string resp_bulk(const std::string& s);    // $len\r\n...\r\n
    std::string resp_nil();                         // $-1\r\n
    std::string resp_nil_array();                   // *-1\r\n
    std::string resp_int(long long v);              // :n\r\n

    // as_bulk=false concatenates already-encoded replies (EXEC results).
    std::string resp_array(const std::vector<std::string>& items, bool as_bulk = true);

    // ---- client side: replies -------------------------------------------------

    struct RespValue {
        enum class Type { Simple, Error, Int, Bulk, Nil, Array };
        Type type = Type::Nil;
        std::string str;               // Simple/Error/Bulk
        long long integer = 0;         // Int
        std::vector<RespValue> elements; // Array

        bool is_nil() const { return type == Type::Nil; }
        bool is_error() const { return type == Type::Error; }
        bool is_array() const { return type == Type::Array; }
    };

    struct RespReplyResult {
        std::optional<RespValue> value; // present when a full reply was parsed
        std::string error;              // non-empty on protocol error
        std::size_t consumed = 0;
    };

    // Parse exactly one reply of any RESP2 type. Same incomplete/error contract
    // as parse_resp; on error the connection should be considered unusable.
    RespReplyResult parse_reply(const char* data, std::size_t len);

    // Encode a command as an array of bulk strings.
    std::string encode_command(const std::vector<std::string>& args);

} // namespace rcache
