/**
 * @file service_container.cpp
 * @brief GTIN Service ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

#include <spdlog/spdlog.h>

#include "db_connection_interface.h"
#include "db_connection_pool_factory.h"
#include "i_query_executor.h"
#include "logger.h"

#include "../repositories/gtin_repository.h"
#include "../services/gtin_service.h"

namespace infrastructure {

struct ServiceContainer::Impl {
    std::shared_ptr<common::IDbConnectionPool> dbPool;
    std::unique_ptr<common::IQueryExecutor> queryExecutor;

    std::unique_ptr<repositories::GtinRepository> gtinRepo;

    std::unique_ptr<services::GtinService> gtinService;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("Initializing GTIN Service dependencies...");

    try {
        common::Logger::setLevel(config.logLevel);
        config.validateRequiredCredentials();

        // Step 1: Database connection pool
        impl_->dbPool = common::DbConnectionPoolFactory::create(config.toPoolConfig());
        if (!impl_->dbPool->initialize()) {
            spdlog::critical("Failed to initialize database connection pool");
            shutdown();
            return false;
        }
        spdlog::info("Database connection pool initialized (type={}, timezone={}, encoding={})",
                     impl_->dbPool->getDatabaseType(), config.dbTimeZone, config.dbClientEncoding);

        // Step 2: Query Executor
        impl_->queryExecutor = common::createQueryExecutor(impl_->dbPool.get());

        // Step 3: Repositories
        impl_->gtinRepo = std::make_unique<repositories::GtinRepository>(impl_->queryExecutor.get());

        // Step 4: Services
        impl_->gtinService = std::make_unique<services::GtinService>(impl_->gtinRepo.get());

        spdlog::info("All GTIN Service dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize GTIN Service: {}", e.what());
        shutdown();
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    bool hadResources = impl_->dbPool != nullptr;

    // Reverse order of initialization
    impl_->gtinService.reset();
    impl_->gtinRepo.reset();
    impl_->queryExecutor.reset();

    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }

    if (hadResources) {
        spdlog::info("GTIN Service dependencies released");
    }
}

common::IDbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
repositories::GtinRepository* ServiceContainer::gtinRepository() const { return impl_->gtinRepo.get(); }
services::GtinService* ServiceContainer::gtinService() const { return impl_->gtinService.get(); }

} // namespace infrastructure
