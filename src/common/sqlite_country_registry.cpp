#include "countryid/common/sqlite_country_registry.h"

#include <string>
#include <system_error>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <sqlite3.h>

namespace countryid {
namespace {

absl::Status ToStatus(int rc, sqlite3* db, const std::string& context) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return absl::OkStatus();
    }

    const char* msg = db ? sqlite3_errmsg(db) : "unknown sqlite error";
    return absl::InternalError(context + ": " + msg);
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

CountryInfo ReadRow(sqlite3_stmt* stmt) {
    CountryInfo info;
    info.code = static_cast<uint32_t>(sqlite3_column_int64(stmt, 0));
    info.name = ColumnText(stmt, 1);
    info.alpha2 = ColumnText(stmt, 2);
    info.alpha3 = ColumnText(stmt, 3);
    return info;
}

}  // namespace

SqliteCountryRegistry::SqliteCountryRegistry(const std::filesystem::path& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    auto abs_db_path = std::filesystem::absolute(db_path, ec);
    if (ec) {
        open_status_ = absl::InvalidArgumentError(
            "Failed to compute absolute path: " + db_path.string());
        LOG(ERROR) << "[Registry] " << open_status_.message();
        return;
    }

    std::filesystem::create_directories(abs_db_path.parent_path(), ec);

    const int rc = sqlite3_open(abs_db_path.string().c_str(), &db_);
    if (rc != SQLITE_OK) {
        open_status_ = ToStatus(rc, db_, "Open " + abs_db_path.string());
        LOG(ERROR) << "[Registry] " << open_status_.message();
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    auto status = ExecLocked("PRAGMA journal_mode = WAL;");
    if (!status.ok()) {
        LOG(WARNING) << "[Registry] Could not enable WAL: " << status.message();
    }

    open_status_ = InitSchemaLocked();
    if (!open_status_.ok()) {
        LOG(ERROR) << "[Registry] Schema init failed: " << open_status_.message();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

SqliteCountryRegistry::~SqliteCountryRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

absl::Status SqliteCountryRegistry::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_status_;
}

absl::Status SqliteCountryRegistry::ExecLocked(const char* sql) const {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown sqlite exec error";
        sqlite3_free(err);
        return absl::InternalError(msg);
    }
    return absl::OkStatus();
}

absl::Status SqliteCountryRegistry::InitSchemaLocked() {
    if (!db_) {
        return absl::FailedPreconditionError("SQLite DB is not open");
    }

    const char* schema_sql =
        "CREATE TABLE IF NOT EXISTS countries ("
        "  code INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL,"
        "  alpha2 TEXT NOT NULL DEFAULT '',"
        "  alpha3 TEXT NOT NULL DEFAULT ''"
        ");";

    return ExecLocked(schema_sql);
}

std::vector<uint32_t> SqliteCountryRegistry::ListCodes() const {
    std::vector<uint32_t> result;
    for (const auto& info : List()) {
        result.push_back(info.code);
    }
    return result;
}

std::vector<CountryInfo> SqliteCountryRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CountryInfo> result;
    if (!db_) {
        return result;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT code, name, alpha2, alpha3 FROM countries ORDER BY code";
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG(ERROR) << "[Registry] " << ToStatus(rc, db_, "Prepare List").message();
        return result;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.push_back(ReadRow(stmt));
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG(ERROR) << "[Registry] " << ToStatus(rc, db_, "Step List").message();
    }
    return result;
}

absl::StatusOr<CountryInfo> SqliteCountryRegistry::Lookup(uint32_t code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return absl::FailedPreconditionError("SQLite DB is not open");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT code, name, alpha2, alpha3 FROM countries WHERE code = ?";
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ToStatus(rc, db_, "Prepare Lookup");
    }

    sqlite3_bind_int64(stmt, 1, code);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        CountryInfo info = ReadRow(stmt);
        sqlite3_finalize(stmt);
        return info;
    }

    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return absl::NotFoundError(absl::StrCat("Country not found: ", code));
    }
    return ToStatus(rc, db_, "Step Lookup");
}

absl::StatusOr<CountryInfo> SqliteCountryRegistry::Find(std::string_view text) const {
    uint32_t code = 0;
    if (ParseCountryCode(text, &code)) {
        return Lookup(code);
    }

    const std::string needle(absl::StripAsciiWhitespace(text));
    if (needle.empty()) {
        return absl::InvalidArgumentError("Empty country name");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return absl::FailedPreconditionError("SQLite DB is not open");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "SELECT code, name, alpha2, alpha3 FROM countries "
        "WHERE alpha2 = ?1 COLLATE NOCASE OR alpha3 = ?1 COLLATE NOCASE "
        "   OR name = ?1 COLLATE NOCASE "
        "ORDER BY code LIMIT 1";
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ToStatus(rc, db_, "Prepare Find");
    }

    sqlite3_bind_text(stmt, 1, needle.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        CountryInfo info = ReadRow(stmt);
        sqlite3_finalize(stmt);
        return info;
    }

    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) {
        return absl::NotFoundError(absl::StrCat("Country not found: \"", needle, "\""));
    }
    return ToStatus(rc, db_, "Step Find");
}

bool SqliteCountryRegistry::Contains(uint32_t code) const {
    return Lookup(code).ok();
}

absl::Status SqliteCountryRegistry::UpsertLocked(const CountryInfo& info) {
    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "INSERT INTO countries(code, name, alpha2, alpha3) VALUES(?, ?, ?, ?) "
        "ON CONFLICT(code) DO UPDATE SET "
        "  name=excluded.name,"
        "  alpha2=excluded.alpha2,"
        "  alpha3=excluded.alpha3";

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ToStatus(rc, db_, "Prepare Upsert");
    }

    sqlite3_bind_int64(stmt, 1, info.code);
    sqlite3_bind_text(stmt, 2, info.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, info.alpha2.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, info.alpha3.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return ToStatus(rc, db_, "Step Upsert");
    }
    return absl::OkStatus();
}

absl::Status SqliteCountryRegistry::Upsert(const CountryInfo& info) {
    auto status = ValidateCountryInfo(info);
    if (!status.ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return absl::FailedPreconditionError("SQLite DB is not open");
    }
    return UpsertLocked(info);
}

absl::Status SqliteCountryRegistry::Remove(uint32_t code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return absl::FailedPreconditionError("SQLite DB is not open");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "DELETE FROM countries WHERE code = ?";
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ToStatus(rc, db_, "Prepare Remove");
    }

    sqlite3_bind_int64(stmt, 1, code);

    rc = sqlite3_step(stmt);
    const int changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return ToStatus(rc, db_, "Step Remove");
    }
    if (changes == 0) {
        return absl::NotFoundError(absl::StrCat("Country not found: ", code));
    }
    return absl::OkStatus();
}

absl::Status SqliteCountryRegistry::SeedFrom(const CountryRegistry& source) {
    const std::vector<CountryInfo> entries = source.List();
    for (const auto& info : entries) {
        auto status = ValidateCountryInfo(info);
        if (!status.ok()) {
            return status;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return absl::FailedPreconditionError("SQLite DB is not open");
    }

    auto status = ExecLocked("BEGIN;");
    if (!status.ok()) {
        return status;
    }

    for (const auto& info : entries) {
        status = UpsertLocked(info);
        if (!status.ok()) {
            RollbackLocked();
            return status;
        }
    }

    status = ExecLocked("COMMIT;");
    if (!status.ok()) {
        RollbackLocked();
    }
    return status;
}

void SqliteCountryRegistry::RollbackLocked() {
    // A failed COMMIT may already have ended the transaction
    if (sqlite3_get_autocommit(db_)) {
        return;
    }
    auto rollback = ExecLocked("ROLLBACK;");
    if (!rollback.ok()) {
        LOG(ERROR) << "[Registry] Rollback failed: " << rollback.message();
    }
}

size_t SqliteCountryRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM countries", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

}  // namespace countryid
