#pragma once

#include <filesystem>
#include <mutex>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "countryid/common/country_registry.h"

struct sqlite3;

namespace countryid {

/* Country registry persisted in an SQLite database. */
/* Lets deployments define their own code sets (anything that fits in 22 bits). */
class SqliteCountryRegistry : public CountryRegistry {
public:
    explicit SqliteCountryRegistry(const std::filesystem::path& db_path);
    ~SqliteCountryRegistry() override;

    SqliteCountryRegistry(const SqliteCountryRegistry&) = delete;
    SqliteCountryRegistry& operator=(const SqliteCountryRegistry&) = delete;
    SqliteCountryRegistry(SqliteCountryRegistry&&) = delete;
    SqliteCountryRegistry& operator=(SqliteCountryRegistry&&) = delete;

    // Why the database could not be opened, or OK
    absl::Status status() const;

    std::vector<uint32_t> ListCodes() const override;
    std::vector<CountryInfo> List() const override;
    absl::StatusOr<CountryInfo> Lookup(uint32_t code) const override;
    absl::StatusOr<CountryInfo> Find(std::string_view text) const override;
    bool Contains(uint32_t code) const override;

    absl::Status Upsert(const CountryInfo& info);
    absl::Status Remove(uint32_t code);

    // Copies every entry of `source` in one transaction
    absl::Status SeedFrom(const CountryRegistry& source);

    size_t Size() const;

private:
    absl::Status InitSchemaLocked();
    absl::Status ExecLocked(const char* sql) const;
    absl::Status UpsertLocked(const CountryInfo& info);
    void RollbackLocked();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    absl::Status open_status_;
};

}  // namespace countryid
