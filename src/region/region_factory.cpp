#include <rcache/region/region_factory.hpp>
#include <rcache/client/local_connection.hpp>
#include <rcache/client/tcp_connection.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>

namespace rcache {

    std::string_view to_string(AccessType t) {
        switch (t) {
        case AccessType::ReadOnly: return "read-only";
        case AccessType::ReadWrite: return "read-write";
        case AccessType::NonstrictReadWrite: return "nonstrict-read-write";
        case AccessType::Transactional: return "transactional";
        }
        return "unknown";
    }

    RegionFactory::RegionFactory(Properties props, const clock::Clock& clk)
        : props_(std::move(props))
        , settings_(FactorySettings::from_properties(props_))
        , clock_(clk) {}

    RegionFactory::RegionFactory(Properties props, std::shared_ptr<EmbeddedStore> store,
        const clock::Clock& clk)
        : props_(std::move(props))
        , settings_(FactorySettings::from_properties(props_))
        , clock_(clk)
        , embedded_(std::move(store)) {
        if (!embedded_) throw RegionStateError("embedded backend requires a store");
        settings_.backend = Backend::Embedded;
    }

    RegionFactory::~RegionFactory() {
        stop();
    }

    static std::unique_ptr<Connection> open_connection(const FactorySettings& s,
        const std::shared_ptr<EmbeddedStore>& store) {
        if (s.backend == Backend::Embedded) {
            return std::make_unique<LocalConnection>(*store);
        }
        return std::make_unique<TcpConnection>(s.server.host, static_cast<uint16_t>(s.server.port),
            std::chrono::milliseconds(s.server.timeoutMs));
    }

    void RegionFactory::start() {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != State::Idle) throw RegionStateError("region factory already started");

        log::set_level(log::level_from_string(settings_.logLevel));
        if (settings_.backend == Backend::Embedded && !embedded_) {
            embedded_ = std::make_shared<EmbeddedStore>();
        }

        PoolOptions opts;
        opts.maxSize = settings_.pool.maxSize;
        opts.acquireTimeout = std::chrono::milliseconds(settings_.pool.acquireTimeoutMs);
        // regions keep the pool alive past the factory, so it captures by value
        auto pool = std::make_shared<ConnectionPool>(
            [s = settings_, store = embedded_] { return open_connection(s, store); }, opts);

        client_ = std::make_shared<StoreClient>(pool);
        timestamper_ = std::make_shared<Timestamper>(client_, settings_.timestampKey, clock_);
        sweeper_ = std::make_unique<ExpirySweeper>(registry_, client_,
            std::chrono::milliseconds(settings_.sweepIntervalMs), clock_);
        sweeper_->start();
        state_ = State::Running;

        if (settings_.backend == Backend::Embedded) {
            log::infof("factory", "started on the embedded store");
        }
        else {
            log::infof("factory", "started against {}:{}", settings_.server.host, settings_.server.port);
        }
    }

    void RegionFactory::stop() {
        std::unique_ptr<ExpirySweeper> sweeper;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ != State::Running) return;
            state_ = State::Stopped;
            sweeper = std::move(sweeper_);
            client_.reset();
        }
        if (sweeper) sweeper->stop();
        log::infof("factory", "stopped");
    }

    bool RegionFactory::running() const {
        std::lock_guard<std::mutex> lk(mu_);
        return state_ == State::Running;
    }

    void RegionFactory::require_running(const char* op) const {
        if (state_ != State::Running) {
            throw RegionStateError(std::string(op) + ": region factory is not started");
        }
    }

    std::shared_ptr<Region> RegionFactory::make_region(RegionSettings s) {
        return std::make_shared<Region>(std::move(s), client_, clock_, timestamper_);
    }

    std::shared_ptr<Region> RegionFactory::build_region(const std::string& name, const Properties& overrides) {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("build_region");
        auto s = RegionSettings::from_properties(name, props_.with_overrides(overrides), settings_);
        auto region = make_region(std::move(s));
        if (registry_.add(name)) {
            log::debugf("factory", "registered region '{}' (expiry {}s)", name, region->settings().expiryInSeconds);
        }
        return region;
    }

    std::shared_ptr<Region> RegionFactory::build_timestamps_region(const std::string& name, const Properties& overrides) {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("build_timestamps_region");
        auto s = RegionSettings::from_properties(name, props_.with_overrides(overrides), settings_);
        s.timeBasedExpiry = false;
        return make_region(std::move(s));
    }

    long long RegionFactory::next_timestamp() {
        std::shared_ptr<Timestamper> ts;
        {
            std::lock_guard<std::mutex> lk(mu_);
            require_running("next_timestamp");
            ts = timestamper_;
        }
        return ts->next();
    }

    bool RegionFactory::minimal_puts_enabled_by_default() const {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("minimal_puts_enabled_by_default");
        return true;
    }

    AccessType RegionFactory::default_access_type() const {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("default_access_type");
        return AccessType::ReadWrite;
    }

    void RegionFactory::flush() {
        std::shared_ptr<StoreClient> client;
        {
            std::lock_guard<std::mutex> lk(mu_);
            require_running("flush");
            client = client_;
        }
        client->flush_db();
    }

    ExpirySweeper& RegionFactory::sweeper() {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("sweeper");
        return *sweeper_;
    }

    Timestamper& RegionFactory::timestamper() {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("timestamper");
        return *timestamper_;
    }

    StoreClient& RegionFactory::client() {
        std::lock_guard<std::mutex> lk(mu_);
        require_running("client");
        return *client_;
    }

} // namespace rcache
