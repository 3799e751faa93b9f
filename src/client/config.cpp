#include "countryid/client/config.h"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <pwd.h>
#include <unistd.h>

#include <absl/strings/numbers.h>

#include "countryid/common/logging.h"

namespace countryid {

namespace {

std::string JsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string JsonUnescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        switch (s[++i]) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default:
            out += s[i];
            break;
        }
    }
    return out;
}

std::optional<std::string> ExtractJsonStringField(const std::string& text, std::string_view key) {
    std::string pattern;
    pattern.reserve(key.size() + 24);
    pattern += "\"";
    pattern += key;
    pattern += "\"";
    pattern += "\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"";

    const std::regex re(pattern);
    std::smatch m;
    if (!std::regex_search(text, m, re) || m.size() < 2) {
        return std::nullopt;
    }
    return JsonUnescape(m[1].str());
}

std::optional<long long> ExtractJsonIntField(const std::string& text, std::string_view key) {
    std::string pattern;
    pattern.reserve(key.size() + 16);
    pattern += "\"";
    pattern += key;
    pattern += "\"";
    pattern += "\\s*:\\s*([0-9]+)";

    const std::regex re(pattern);
    std::smatch m;
    long long value = 0;
    if (!std::regex_search(text, m, re) || m.size() < 2 ||
        !absl::SimpleAtoi(m[1].str(), &value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string ExpandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;  // ~user/... is not supported
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        const passwd* pw = getpwuid(getuid());
        if (pw == nullptr || pw->pw_dir == nullptr) {
            return path;
        }
        home = pw->pw_dir;
    }

    return std::string(home) + path.substr(1);
}

ClientConfig::ClientConfig()
    : server_address_("localhost:50061"),
      request_timeout_(5000),
      default_country_("Unknown"),
      log_level_("warning") {
}

ClientConfig::~ClientConfig() = default;

absl::Status ClientConfig::Load(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        return absl::NotFoundError("Config file not found: " + config_file.string());
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    if (auto v = ExtractJsonStringField(text, "server_address")) {
        server_address_ = *v;
    }
    if (auto v = ExtractJsonIntField(text, "request_timeout_ms")) {
        if (*v <= 0) {
            return absl::InvalidArgumentError(
                "Invalid value for request_timeout_ms: " + std::to_string(*v));
        }
        request_timeout_ = std::chrono::milliseconds(*v);
    }
    if (auto v = ExtractJsonStringField(text, "default_country")) {
        default_country_ = *v;
    }
    if (auto v = ExtractJsonStringField(text, "registry_path")) {
        registry_path_ = *v;
    }
    if (auto v = ExtractJsonStringField(text, "log_level")) {
        log_level_ = *v;
    }

    return absl::OkStatus();
}

absl::Status ClientConfig::Save(const std::filesystem::path& config_file) const {
    std::error_code ec;
    auto parent = config_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return absl::InternalError("Failed to create config directory");
        }
    }

    std::ofstream out(config_file, std::ios::trunc);
    if (!out.is_open()) {
        return absl::InternalError("Failed to open config file for writing");
    }

    out << "{\n";
    out << "  \"server_address\": \"" << JsonEscape(server_address_) << "\",\n";
    out << "  \"request_timeout_ms\": " << request_timeout_.count() << ",\n";
    out << "  \"default_country\": \"" << JsonEscape(default_country_) << "\",\n";
    out << "  \"registry_path\": \"" << JsonEscape(registry_path_.string()) << "\",\n";
    out << "  \"log_level\": \"" << JsonEscape(log_level_) << "\"\n";
    out << "}\n";

    if (!out.good()) {
        return absl::InternalError("Failed to write config file");
    }
    return absl::OkStatus();
}

absl::Status ClientConfig::Set(const std::string& key, const std::string& value) {
    if (key == "server_address") {
        server_address_ = value;
    } else if (key == "request_timeout_ms") {
        long long ms = 0;
        if (!absl::SimpleAtoi(value, &ms) || ms <= 0) {
            return absl::InvalidArgumentError("Invalid value for request_timeout_ms: " + value);
        }
        request_timeout_ = std::chrono::milliseconds(ms);
    } else if (key == "default_country") {
        default_country_ = value;
    } else if (key == "registry_path") {
        registry_path_ = value;
    } else if (key == "log_level") {
        auto level = ParseLogLevel(value);
        if (!level.ok()) {
            return level.status();
        }
        log_level_ = value;
    } else {
        return absl::InvalidArgumentError("Unknown config key: " + key);
    }
    return absl::OkStatus();
}

void ClientConfig::SetServerAddress(const std::string& address) {
    server_address_ = address;
}

const std::string& ClientConfig::GetServerAddress() const {
    return server_address_;
}

void ClientConfig::SetRequestTimeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

std::chrono::milliseconds ClientConfig::GetRequestTimeout() const {
    return request_timeout_;
}

void ClientConfig::SetDefaultCountry(const std::string& country) {
    default_country_ = country;
}

const std::string& ClientConfig::GetDefaultCountry() const {
    return default_country_;
}

void ClientConfig::SetRegistryPath(const std::filesystem::path& path) {
    registry_path_ = path;
}

const std::filesystem::path& ClientConfig::GetRegistryPath() const {
    return registry_path_;
}

void ClientConfig::SetLogLevel(const std::string& level) {
    log_level_ = level;
}

const std::string& ClientConfig::GetLogLevel() const {
    return log_level_;
}

}  // namespace countryid
