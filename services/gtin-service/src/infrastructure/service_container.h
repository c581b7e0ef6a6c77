#pragma once

/**
 * @file service_container.h
 * @brief Service container for GTIN Service dependency management
 *
 * Owns the connection pool, query executor, repository and service.
 * Provides non-owning pointer accessors for the application's write path.
 */

#include <memory>

struct AppConfig;

namespace common {
    class IDbConnectionPool;
    class IQueryExecutor;
}

namespace repositories {
    class GtinRepository;
}

namespace services {
    class GtinService;
}

namespace infrastructure {

class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    /// Accessors return nullptr before initialize() succeeds or after shutdown()
    common::IDbConnectionPool* dbPool() const;
    common::IQueryExecutor* queryExecutor() const;
    repositories::GtinRepository* gtinRepository() const;
    services::GtinService* gtinService() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
