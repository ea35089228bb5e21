#include <rcache/proto/resp.hpp>
#include <algorithm>
#include <sstream>
#include <string_view>
#include <limits>
#include <cstdlib>

namespace rcache {

    // ---------- helpers
    static inline long long parse_ll(std::string_view s, bool& ok) {
        ok = true;
        if (s.empty()) { ok = false; return 0; }
        long long sign = 1; size_t i = 0;
        if (s[0] == '-') { sign = -1; i = 1; if (s.size() == 1) { ok = false; return 0; } }
        long long v = 0;
        for (; i < s.size(); ++i) {
            char c = s[i];
            if (c < '0' || c > '9') { ok = false; return 0; }
            long long d = (c - '0');
            if (v > (std::numeric_limits<long long>::max() - d) / 10) { ok = false; return 0; }
            v = v * 10 + d;
        }
        return v * sign;
    }

    // Reads a RESP "line" (without the trailing CRLF): [start,end) is the
    // content and next points after the CRLF.
    struct Line {
        bool ok = false;
        std::size_t start = 0, end = 0, next = 0;
    };
    static inline Line get_line(const char* data, std::size_t len, std::size_t off) {
        Line L;
        for (std::size_t i = off; i + 1 < len; ++i) {
            if (data[i] == '\r' && data[i + 1] == '\n') {
                L.ok = true; L.start = off; L.end = i; L.next = i + 2;
                return L;
            }
        }
        return L;
    }

    // request parser
    RespParseResult parse_resp(const char* data, std::size_t len) {
        RespParseResult r;
        if (len == 0) return r;

        // expect an Array: "*<n>\r\n" then n Bulk strings "$<len>\r\n<data>\r\n"
        if (data[0] != '*') {
            // inline commands are not supported; drop the line
            auto L = get_line(data, len, 0);
            r.error = "protocol error: expected array";
            r.consumed = L.ok ? L.next : 0;
            return r;
        }

        auto L = get_line(data, len, 1);
        if (!L.ok) return r; // need more
        bool ok = false;
        long long n = parse_ll(std::string_view{ data + 1, L.end - 1 }, ok);
        if (!ok || n < 0 || n > kMaxRequestArgs) { r.error = "protocol error: bad array length"; r.consumed = L.next; return r; }
        std::size_t off = L.next;

        RespArray arr;
        // each argument takes at least one byte on the wire
        arr.args.reserve(std::min<std::size_t>(static_cast<std::size_t>(n), len - off));
        for (long long i = 0; i < n; ++i) {
            if (off >= len) return r; // need more
            if (data[off] != '$') { r.error = "protocol error: expected bulk string"; r.consumed = off; return r; }
            auto L2 = get_line(data, len, off + 1);
            if (!L2.ok) return r; // need more
            long long blen = parse_ll(std::string_view{ data + off + 1, L2.end - (off + 1) }, ok);
            if (!ok) { r.error = "protocol error: bad bulk length"; r.consumed = L2.next; return r; }
            off = L2.next;
            if (blen == -1) {
                arr.args.emplace_back();
                continue;
            }
            if (blen < 0) { r.error = "protocol error: negative bulk length"; r.consumed = off; return r; }
            if (off + static_cast<std::size_t>(blen) + 2 > len) return r; // need more
            arr.args.emplace_back(data + off, data + off + blen);
            off += static_cast<std::size_t>(blen);
            if (data[off] != '\r' || data[off + 1] != '\n') { r.error = "protocol error: bulk missing CRLF"; r.consumed = off; return r; }
            off += 2;
        }

        r.arr = std::move(arr);
        r.consumed = off;
        return r;
    }

    // reply parser

    enum class Step { Done, NeedMore, Bad };

    static Step parse_value_at(const char* data, std::size_t len, std::size_t& off,
        RespValue& out, std::string& err) {
        if (off >= len) return Step::NeedMore;
        char t = data[off];
        auto L = get_line(data, len, off + 1);
        if (!L.ok) return Step::NeedMore;
        std::string_view body{ data + L.start, L.end - L.start };
        bool ok = false;

        switch (t) {
        case '+':
            out.type = RespValue::Type::Simple;
            out.str.assign(body);
            off = L.next;
            return Step::Done;
        case '-':
            out.type = RespValue::Type::Error;
            out.str.assign(body);
            off = L.next;
            return Step::Done;
        case ':':
            out.integer = parse_ll(body, ok);
            if (!ok) { err = "protocol error: bad integer"; return Step::Bad; }
            out.type = RespValue::Type::Int;
            off = L.next;
            return Step::Done;
        case '$': {
            long long blen = parse_ll(body, ok);
            if (!ok || blen < -1) { err = "protocol error: bad bulk length"; return Step::Bad; }
            if (blen == -1) { out.type = RespValue::Type::Nil; off = L.next; return Step::Done; }
            std::size_t start = L.next;
            if (start + static_cast<std::size_t>(blen) + 2 > len) return Step::NeedMore;
            std::size_t end = start + static_cast<std::size_t>(blen);
            if (data[end] != '\r' || data[end + 1] != '\n') { err = "protocol error: bulk missing CRLF"; return Step::Bad; }
            out.type = RespValue::Type::Bulk;
            out.str.assign(data + start, data + end);
            off = end + 2;
            return Step::Done;
        }
        case '*': {
            long long n = parse_ll(body, ok);
            if (!ok || n < -1) { err = "protocol error: bad array length"; return Step::Bad; }
            if (n == -1) { out.type = RespValue::Type::Nil; off = L.next; return Step::Done; }
            std::size_t cur = L.next;
            std::vector<RespValue> elems;
            elems.reserve(std::min<std::size_t>(static_cast<std::size_t>(n), len - cur));
            for (long long i = 0; i < n; ++i) {
                RespValue v;
                auto s = parse_value_at(data, len, cur, v, err);
                if (s != Step::Done) return s;
                elems.push_back(std::move(v));
            }
            out.type = RespValue::Type::Array;
            out.elements = std::move(elems);
            off = cur;
            return Step::Done;
        }
        default:
            err = "protocol error: unknown reply type";
            return Step::Bad;
        }
    }

    RespReplyResult parse_reply(const char* data, std::size_t len) {
        RespReplyResult r;
        std::size_t off = 0;
        RespValue v;
        switch (parse_value_at(data, len, off, v, r.error)) {
        case Step::Done:
            r.value = std::move(v);
            r.consumed = off;
            break;
        case Step::NeedMore:
            break;
        case Step::Bad:
            r.consumed = len;
            break;
        }
        return r;
    }

    std::string encode_command(const std::vector<std::string>& args) {
        std::string out;
        out.reserve(16 + args.size() * 16);
        out += '*';
        out += std::to_string(args.size());
        out += "\r\n";
        for (auto& a : args) {
            out += '$';
            out += std::to_string(a.size());
            out += "\r\n";
            out += a;
            out += "\r\n";
        }
        return out;
    }

    // emitters
    std::string resp_simple(const std::string& s) { return "+" + s + "\r\n"; }
    std::string resp_error(const std::string& s) { return "-ERR " + s + "\r\n"; }
    std::string resp_error_code(const std::string& code, const std::string& s) { return "-" + code + " " + s + "\r\n"; }

    std::string resp_bulk(const std::string& s) {
        std::ostringstream o; o << "$" << s.size() << "\r\n" << s << "\r\n"; return o.str();
    }

    std::string resp_nil() { return "$-1\r\n"; }
    std::string resp_nil_array() { return "*-1\r\n"; }

    std::string resp_int(long long v) {
        std::ostringstream o; o << ":" << v << "\r\n"; return o.str();
    }

    std::string resp_array(const std::vector<std::string>& items, bool as_bulk) {
        std::ostringstream o; o << "*" << items.size() << "\r\n";
        for (auto& it : items) {
            if (as_bulk) o << "$" << it.size() << "\r\n" << it << "\r\n";
            else         o << it;
        }
        return o.str();
    }

} // namespace rcache
