#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <absl/status/status.h>

namespace countryid {

// Replaces a leading "~" or "~/" with the home directory ($HOME, then the
// passwd entry). Returns `path` unchanged when neither is available.
std::string ExpandPath(const std::string& path);

class ClientConfig {
public:
    ClientConfig();
    ~ClientConfig();

    ClientConfig(const ClientConfig&) = delete;
    ClientConfig& operator=(const ClientConfig&) = delete;
    ClientConfig(ClientConfig&&) = delete;
    ClientConfig& operator=(ClientConfig&&) = delete;

    // Load configuration from file
    absl::Status Load(const std::filesystem::path& config_file);

    // Save configuration to file
    absl::Status Save(const std::filesystem::path& config_file) const;

    // Apply a `config set <key> <value>` edit
    absl::Status Set(const std::string& key, const std::string& value);

    // Server settings
    void SetServerAddress(const std::string& address);
    const std::string& GetServerAddress() const;

    void SetRequestTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds GetRequestTimeout() const;

    // Country used by `generate` when none is given
    void SetDefaultCountry(const std::string& country);
    const std::string& GetDefaultCountry() const;

    // Local SQLite registry; empty means the built-in table
    void SetRegistryPath(const std::filesystem::path& path);
    const std::filesystem::path& GetRegistryPath() const;

    // Logging
    void SetLogLevel(const std::string& level);
    const std::string& GetLogLevel() const;

private:
    std::string server_address_;
    std::chrono::milliseconds request_timeout_;
    std::string default_country_;
    std::filesystem::path registry_path_;
    std::string log_level_;
};

}  // namespace countryid
