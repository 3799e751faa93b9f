#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/time/time.h"

#include "countryid/client/config.h"
#include "countryid/client/grpc_client.h"
#include "countryid/common/country_uuid.h"
#include "countryid/common/in_memory_country_registry.h"
#include "countryid/common/logging.h"
#include "countryid/common/sqlite_country_registry.h"

ABSL_FLAG(std::string, config, "~/.config/countryid/config.json", "Path to the client config file");
ABSL_FLAG(std::string, server, "", "Server address; overrides server_address from the config");
ABSL_FLAG(uint32_t, count, 1, "Number of identifiers for generate");
ABSL_FLAG(bool, remote, false, "Run generate/decode/countries on the server instead of locally");

namespace {

std::string FormatTimestamp(const countryid::Uuid& id) {
    return absl::FormatTime(absl::RFC3339_full, countryid::TimestampOf(id), absl::UTCTimeZone());
}

std::string Describe(const countryid::CountryInfo& info) {
    if (info.name.empty()) {
        return std::to_string(info.code) + " (unregistered)";
    }
    std::string out = std::to_string(info.code) + " " + info.name;
    if (!info.alpha2.empty()) {
        out += " (" + info.alpha2 + "/" + info.alpha3 + ")";
    }
    return out;
}

std::unique_ptr<countryid::CountryRegistry> OpenRegistry(const countryid::ClientConfig& config) {
    if (config.GetRegistryPath().empty()) {
        return std::make_unique<countryid::InMemoryCountryRegistry>();
    }
    auto registry = std::make_unique<countryid::SqliteCountryRegistry>(
        countryid::ExpandPath(config.GetRegistryPath().string()));
    if (!registry->status().ok()) {
        std::cerr << "Failed to open registry: " << registry->status().message() << std::endl;
        return nullptr;
    }
    return registry;
}

int RunGenerate(const countryid::ClientConfig& config,
                countryid::GRPCClient* remote,
                const std::string& country,
                uint32_t count) {
    if (remote != nullptr) {
        auto ids = remote->Generate(country, count);
        if (!ids.ok()) {
            std::cerr << "Error: " << ids.status().message() << std::endl;
            return 1;
        }
        for (const auto& id : *ids) {
            std::cout << id << "\n";
        }
        return 0;
    }

    auto registry = OpenRegistry(config);
    if (!registry) {
        return 1;
    }

    uint32_t code = 0;
    auto info = registry->Find(country);
    if (info.ok()) {
        code = info->code;
    } else if (!countryid::ParseCountryCode(country, &code)) {
        std::cerr << "Error: " << info.status().message() << std::endl;
        return 1;
    }

    for (uint32_t i = 0; i < count; ++i) {
        auto id = countryid::Encode(code);
        if (!id.ok()) {
            std::cerr << "Error: " << id.status().message() << std::endl;
            return 1;
        }
        std::cout << *id << "\n";
    }
    return 0;
}

int RunDecode(const countryid::ClientConfig& config,
              countryid::GRPCClient* remote,
              const countryid::Uuid& id) {
    countryid::CountryInfo country;
    if (remote != nullptr) {
        auto decoded = remote->Decode(id);
        if (!decoded.ok()) {
            std::cerr << "Error: " << decoded.status().message() << std::endl;
            return 1;
        }
        country = decoded->country;
    } else {
        auto code = countryid::DecodeCountry(id);
        if (!code.ok()) {
            std::cerr << "Error: " << code.status().message() << std::endl;
            return 1;
        }
        auto registry = OpenRegistry(config);
        if (!registry) {
            return 1;
        }
        auto info = registry->Lookup(*code);
        if (info.ok()) {
            country = *info;
        } else {
            country.code = *code;
        }
    }

    std::cout << "UUID:      " << id << "\n";
    std::cout << "Country:   " << Describe(country) << "\n";
    std::cout << "Timestamp: " << FormatTimestamp(id) << "\n";
    return 0;
}

int RunCountries(const countryid::ClientConfig& config, countryid::GRPCClient* remote) {
    std::vector<countryid::CountryInfo> countries;
    if (remote != nullptr) {
        auto listed = remote->ListCountries();
        if (!listed.ok()) {
            std::cerr << "Error: " << listed.status().message() << std::endl;
            return 1;
        }
        countries = std::move(*listed);
    } else {
        auto registry = OpenRegistry(config);
        if (!registry) {
            return 1;
        }
        countries = registry->List();
    }

    for (const auto& info : countries) {
        std::cout << Describe(info) << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "Generates and inspects country UUIDs.\n\n"
        "Usage:\n"
        "  countryid-client [--config path] <command> [args...]\n\n"
        "Commands:\n"
        "  generate [country]          Print new identifiers (default country from config)\n"
        "  decode <uuid>               Print the embedded country and timestamp\n"
        "  timestamp <uuid>            Print the embedded timestamp only\n"
        "  countries                   List the country registry\n"
        "  config set <key> <value>    Change a config value\n\n"
        "Config keys: server_address, request_timeout_ms, default_country,\n"
        "             registry_path, log_level\n\n"
        "Examples:\n"
        "  countryid-client generate RU --count=5\n"
        "  countryid-client generate 840 --remote\n"
        "  countryid-client decode 0185e4c2-7a3b-8c11-8003-48a1b2c3d4e5\n"
        "  countryid-client config set server_address localhost:50061");
    std::vector<char*> args = absl::ParseCommandLine(argc, argv);

    const std::string config_path = countryid::ExpandPath(absl::GetFlag(FLAGS_config));

    std::vector<std::string> command_args;
    for (size_t i = 1; i < args.size(); ++i) {
        command_args.push_back(args[i]);
    }
    if (command_args.empty()) {
        std::cerr << "Error: no command given, see --help" << std::endl;
        return 1;
    }
    const std::string command = command_args[0];

    countryid::ClientConfig config;
    auto load_status = config.Load(config_path);
    if (!load_status.ok() && !absl::IsNotFound(load_status)) {
        std::cerr << "Failed to load config: " << load_status.message() << std::endl;
        return 1;
    }

    if (command == "config") {
        if (command_args.size() != 4 || command_args[1] != "set") {
            std::cerr << "Usage: config set <key> <value>\n";
            return 1;
        }
        auto status = config.Set(command_args[2], command_args[3]);
        if (!status.ok()) {
            std::cerr << "Error: " << status.message() << std::endl;
            return 1;
        }
        status = config.Save(config_path);
        if (!status.ok()) {
            std::cerr << "Failed to save config: " << status.message() << std::endl;
            return 1;
        }
        std::cout << "Config updated: " << command_args[2] << " = " << command_args[3] << std::endl;
        return 0;
    }

    auto log_status = countryid::InitLogging(config.GetLogLevel());
    if (!log_status.ok()) {
        std::cerr << "Invalid log_level in config: " << log_status.message() << std::endl;
        return 1;
    }

    std::unique_ptr<countryid::GRPCClient> remote;
    if (absl::GetFlag(FLAGS_remote)) {
        const std::string server = absl::GetFlag(FLAGS_server).empty()
            ? config.GetServerAddress()
            : absl::GetFlag(FLAGS_server);
        remote = std::make_unique<countryid::GRPCClient>(server, config.GetRequestTimeout());
        auto status = remote->Connect();
        if (!status.ok()) {
            std::cerr << "Failed to connect: " << status.message() << std::endl;
            return 1;
        }
    }

    if (command == "generate") {
        const std::string country = command_args.size() > 1
            ? command_args[1]
            : config.GetDefaultCountry();
        const uint32_t count = absl::GetFlag(FLAGS_count);
        if (count == 0) {
            std::cerr << "Error: --count must be positive" << std::endl;
            return 1;
        }
        return RunGenerate(config, remote.get(), country, count);
    }

    if (command == "decode" || command == "timestamp") {
        if (command_args.size() != 2) {
            std::cerr << "Usage: " << command << " <uuid>\n";
            return 1;
        }
        auto id = countryid::Uuid::Parse(command_args[1]);
        if (!id.ok()) {
            std::cerr << "Error: " << id.status().message() << std::endl;
            return 1;
        }
        if (command == "timestamp") {
            std::cout << FormatTimestamp(*id) << std::endl;
            return 0;
        }
        return RunDecode(config, remote.get(), *id);
    }

    if (command == "countries") {
        return RunCountries(config, remote.get());
    }

    std::cerr << "Error: unknown command: " << command << std::endl;
    return 1;
}
