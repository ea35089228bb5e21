#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <rcache/config/properties.hpp>
#include <rcache/core/router.hpp>
#include <rcache/expiry/sweeper.hpp>
#include <rcache/region/region.hpp>
#include <rcache/region/registry.hpp>
#include <rcache/time/timestamper.hpp>

namespace rcache {

    // Concurrency strategies a caching layer may request for a region.
    enum class AccessType { ReadOnly, ReadWrite, NonstrictReadWrite, Transactional };
    std::string_view to_string(AccessType t);

    // Entry point: owns the connection pool, the timestamp generator, the
    // region registry and the sweeper, and hands out regions sharing them.
    //
    //   RegionFactory f(Properties::load("rcache.properties"));
    //   f.start();
    //   auto users = f.build_region("users");
    //   users->put("42", Value{{"name", "ada"}});
    //
    // Every operation other than start() throws RegionStateError while the
    // factory is not running.
    class RegionFactory {
    public:
        explicit RegionFactory(Properties props, const clock::Clock& clk = clock::system());
        // Embedded backend over a caller-owned store, regardless of rcache.backend.
        RegionFactory(Properties props, std::shared_ptr<EmbeddedStore> store,
            const clock::Clock& clk = clock::system());
        ~RegionFactory();

        RegionFactory(const RegionFactory&) = delete;
        RegionFactory& operator=(const RegionFactory&) = delete;

        void start();
        void stop();
        bool running() const;

        std::shared_ptr<Region> build_region(const std::string& name, const Properties& overrides = {});
        // Time-based expiry off and not swept; holds update timestamps.
        std::shared_ptr<Region> build_timestamps_region(const std::string& name, const Properties& overrides = {});

        long long next_timestamp();
        bool minimal_puts_enabled_by_default() const;
        AccessType default_access_type() const;
        void flush();

        const FactorySettings& settings() const { return settings_; }
        const RegionRegistry& registry() const { return registry_; }
        ExpirySweeper& sweeper();
        Timestamper& timestamper();
        StoreClient& client();

    private:
        enum class State { Idle, Running, Stopped };

        void require_running(const char* op) const;
        std::shared_ptr<Region> make_region(RegionSettings s);

        Properties props_;
        FactorySettings settings_;
        const clock::Clock& clock_;
        std::shared_ptr<EmbeddedStore> embedded_;
        RegionRegistry registry_;

        mutable std::mutex mu_;
        State state_ = State::Idle;
        std::shared_ptr<StoreClient> client_;
        std::shared_ptr<Timestamper> timestamper_;
        std::unique_ptr<ExpirySweeper> sweeper_;
    };

} // namespace rcache
