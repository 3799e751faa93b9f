#include "countryid/common/in_memory_country_registry.h"

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "countryid/common/iso3166.h"

namespace countryid {

InMemoryCountryRegistry::InMemoryCountryRegistry() {
    countries_[kUnknownCountryCode] = UnknownCountry();
    for (const auto& info : Iso3166Countries()) {
        countries_[info.code] = info;
    }
}

InMemoryCountryRegistry::InMemoryCountryRegistry(const std::vector<CountryInfo>& countries) {
    for (const auto& info : countries) {
        auto status = ValidateCountryInfo(info);
        if (!status.ok()) {
            LOG(WARNING) << "[Registry] Skipping entry: " << status.message();
            continue;
        }
        countries_[info.code] = info;
    }
}

std::vector<uint32_t> InMemoryCountryRegistry::ListCodes() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<uint32_t> result;
    result.reserve(countries_.size());
    for (const auto& [code, _] : countries_) {
        result.push_back(code);
    }
    return result;
}

std::vector<CountryInfo> InMemoryCountryRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CountryInfo> result;
    result.reserve(countries_.size());
    for (const auto& [_, info] : countries_) {
        result.push_back(info);
    }
    return result;
}

absl::StatusOr<CountryInfo> InMemoryCountryRegistry::Lookup(uint32_t code) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = countries_.find(code);
    if (it == countries_.end()) {
        return absl::NotFoundError(absl::StrCat("Country not found: ", code));
    }
    return it->second;
}

absl::StatusOr<CountryInfo> InMemoryCountryRegistry::Find(std::string_view text) const {
    uint32_t code = 0;
    if (ParseCountryCode(text, &code)) {
        return Lookup(code);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, info] : countries_) {
        if (MatchesCountry(info, text)) {
            return info;
        }
    }
    return absl::NotFoundError(absl::StrCat("Country not found: \"", text, "\""));
}

bool InMemoryCountryRegistry::Contains(uint32_t code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return countries_.count(code) != 0;
}

absl::Status InMemoryCountryRegistry::Upsert(const CountryInfo& info) {
    auto status = ValidateCountryInfo(info);
    if (!status.ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    countries_[info.code] = info;
    return absl::OkStatus();
}

}  // namespace countryid
