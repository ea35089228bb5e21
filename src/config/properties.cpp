#include <rcache/config/properties.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rcache {

    static std::string trim(std::string_view s) {
        std::size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return std::string(s.substr(b, e - b));
    }

    Properties Properties::from_string(std::string_view text) {
        Properties p;
        std::size_t off = 0;
        while (off <= text.size()) {
            auto nl = text.find('\n', off);
            if (nl == std::string_view::npos) nl = text.size();
            auto line = trim(text.substr(off, nl - off));
            off = nl + 1;

            if (line.empty() || line[0] == '#' || line[0] == '!') continue;
            auto sep = line.find_first_of("=:");
            if (sep == std::string::npos) {
                p.set(line, "");
                continue;
            }
            auto key = trim(std::string_view(line).substr(0, sep));
            auto value = trim(std::string_view(line).substr(sep + 1));
            if (!key.empty()) p.set(std::move(key), std::move(value));
        }
        return p;
    }

    Properties Properties::load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("cannot read properties file: " + path);
        std::ostringstream buf;
        buf << in.rdbuf();
        return from_string(buf.str());
    }

    void Properties::set(std::string key, std::string value) {
        entries_[std::move(key)] = std::move(value);
    }

    bool Properties::contains(const std::string& key) const {
        return entries_.count(key) > 0;
    }

    std::optional<std::string> Properties::get(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    std::string Properties::get(const std::string& key, const std::string& def) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? def : it->second;
    }

    long long Properties::get_int(const std::string& key, long long def) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return def;
        try {
            std::size_t used = 0;
            // base 0 accepts 0x.. like Integer.decode
            long long v = std::stoll(it->second, &used, 0);
            if (used != it->second.size()) return def;
            return v;
        }
        catch (const std::exception&) {
            return def;
        }
    }

    bool Properties::get_bool(const std::string& key, bool def) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return def;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
        if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
        if (v == "false" || v == "no" || v == "off" || v == "0") return false;
        return def;
    }

    Properties Properties::with_overrides(const Properties& overrides) const {
        Properties out = *this;
        for (const auto& [k, v] : overrides.entries_) out.entries_[k] = v;
        return out;
    }

    FactorySettings FactorySettings::from_properties(const Properties& props) {
        FactorySettings s;
        auto backend = props.get(keys::kBackend, "tcp");
        std::transform(backend.begin(), backend.end(), backend.begin(), [](unsigned char c) { return std::tolower(c); });
        s.backend = backend == "embedded" ? Backend::Embedded : Backend::Tcp;

        s.server.host = props.get(keys::kHost, s.server.host);
        s.server.port = static_cast<int>(props.get_int(keys::kPort, s.server.port));
        s.server.timeoutMs = static_cast<int>(props.get_int(keys::kTimeoutMs, s.server.timeoutMs));

        auto pool_size = props.get_int(keys::kPoolMaxSize, static_cast<long long>(s.pool.maxSize));
        s.pool.maxSize = pool_size < 1 ? 1 : static_cast<std::size_t>(pool_size);
        s.pool.acquireTimeoutMs = static_cast<int>(props.get_int(keys::kPoolAcquireTimeoutMs, s.pool.acquireTimeoutMs));

        s.expiryInSeconds = static_cast<int>(props.get_int(keys::kExpiryInSeconds, s.expiryInSeconds));
        s.cacheLockTimeoutMs = static_cast<int>(props.get_int(keys::kCacheLockTimeout, s.cacheLockTimeoutMs));
        s.sweepIntervalMs = static_cast<int>(props.get_int(keys::kSweepIntervalMs, s.sweepIntervalMs));
        if (s.sweepIntervalMs < 1) s.sweepIntervalMs = 1;
        s.timestampKey = props.get(keys::kTimestampKey, s.timestampKey);
        s.logLevel = props.get(keys::kLogLevel, s.logLevel);
        return s;
    }

    RegionSettings RegionSettings::from_properties(const std::string& name, const Properties& props,
        const FactorySettings& defaults) {
        RegionSettings r;
        r.name = name;
        auto global_expiry = props.get_int(keys::kExpiryInSeconds, defaults.expiryInSeconds);
        r.expiryInSeconds = static_cast<int>(
            props.get_int(std::string(keys::kExpiryInSeconds) + "." + name, global_expiry));
        r.timeBasedExpiry = props.get_bool(std::string(keys::kTimeBasedExpiry) + "." + name,
            props.get_bool(keys::kTimeBasedExpiry, true));
        r.cacheLockTimeoutMs = static_cast<int>(props.get_int(keys::kCacheLockTimeout, defaults.cacheLockTimeoutMs));
        return r;
    }

} // namespace rcache
