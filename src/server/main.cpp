#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/log.h>
#include <grpcpp/grpcpp.h>

#include "countryid/common/clock.h"
#include "countryid/common/in_memory_country_registry.h"
#include "countryid/common/logging.h"
#include "countryid/common/random_source.h"
#include "countryid/common/sqlite_country_registry.h"
#include "countryid/server/service.h"

ABSL_FLAG(std::string, address, "0.0.0.0:50061", "Address to listen on");
ABSL_FLAG(std::string, registry_db, "",
          "SQLite country registry; seeded with ISO 3166-1 when empty. "
          "Built-in table when unset");
ABSL_FLAG(uint32_t, max_batch, 1000, "Maximum identifiers per Generate call");
ABSL_FLAG(bool, strict_countries, false, "Reject country codes missing from the registry");
ABSL_FLAG(std::string, log_level, "info", "debug, info, warning, error or none");

namespace {

std::unique_ptr<countryid::CountryRegistry> OpenRegistry(const std::string& db_path) {
    if (db_path.empty()) {
        LOG(INFO) << "[Server] Using built-in ISO 3166-1 registry";
        return std::make_unique<countryid::InMemoryCountryRegistry>();
    }

    auto registry = std::make_unique<countryid::SqliteCountryRegistry>(db_path);
    if (!registry->status().ok()) {
        LOG(ERROR) << "[Server] Cannot open registry " << db_path << ": "
                   << registry->status().message();
        return nullptr;
    }

    if (registry->Size() == 0) {
        countryid::InMemoryCountryRegistry builtin;
        auto status = registry->SeedFrom(builtin);
        if (!status.ok()) {
            LOG(ERROR) << "[Server] Cannot seed registry: " << status.message();
            return nullptr;
        }
        LOG(INFO) << "[Server] Seeded " << db_path << " with " << registry->Size() << " countries";
    }
    return registry;
}

bool RunServer(const std::string& server_address,
               const countryid::CountryRegistry& registry,
               const countryid::server::ServiceConfig& config) {
    countryid::server::IdServiceImpl service(registry,
                                             countryid::SystemRandomSource::Instance(),
                                             countryid::SystemClock::Instance(),
                                             config);

    auto server = countryid::server::BuildServer(server_address, &service);
    if (!server.ok()) {
        std::cerr << server.status().message() << std::endl;
        return false;
    }

    std::cout << "==================================================" << std::endl;
    std::cout << "countryid server" << std::endl;
    std::cout << "Listening on " << server_address << std::endl;
    std::cout << "Countries: " << registry.ListCodes().size() << std::endl;
    std::cout << "Max batch: " << config.max_batch
              << (config.strict_countries ? " (strict countries)" : "") << std::endl;
    std::cout << "==================================================" << std::endl;
    std::cout << "\nPress Ctrl+C to stop the server.\n" << std::endl;

    (*server)->Wait();
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "Issues and inspects country UUIDs over gRPC.\n\n"
        "Examples:\n"
        "  countryid-server\n"
        "  countryid-server --address=localhost:50061\n"
        "  countryid-server --registry_db=/var/lib/countryid/registry.db --strict_countries");
    absl::ParseCommandLine(argc, argv);

    auto status = countryid::InitLogging(absl::GetFlag(FLAGS_log_level));
    if (!status.ok()) {
        std::cerr << status.message() << std::endl;
        return 1;
    }

    auto registry = OpenRegistry(absl::GetFlag(FLAGS_registry_db));
    if (!registry) {
        return 1;
    }

    countryid::server::ServiceConfig config;
    config.max_batch = absl::GetFlag(FLAGS_max_batch);
    config.strict_countries = absl::GetFlag(FLAGS_strict_countries);
    if (config.max_batch == 0) {
        std::cerr << "--max_batch must be positive" << std::endl;
        return 1;
    }

    if (!RunServer(absl::GetFlag(FLAGS_address), *registry, config)) {
        return 1;
    }
    return 0;
}
