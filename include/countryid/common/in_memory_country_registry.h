#pragma once

#include <map>
#include <mutex>
#include <string_view>
#include <vector>

#include "countryid/common/country_registry.h"

namespace countryid {

class InMemoryCountryRegistry : public CountryRegistry {
public:
    // Built-in ISO 3166-1 table plus code 0 "Unknown"
    InMemoryCountryRegistry();
    explicit InMemoryCountryRegistry(const std::vector<CountryInfo>& countries);
    ~InMemoryCountryRegistry() override = default;

    InMemoryCountryRegistry(const InMemoryCountryRegistry&) = delete;
    InMemoryCountryRegistry& operator=(const InMemoryCountryRegistry&) = delete;
    InMemoryCountryRegistry(InMemoryCountryRegistry&&) = delete;
    InMemoryCountryRegistry& operator=(InMemoryCountryRegistry&&) = delete;

    std::vector<uint32_t> ListCodes() const override;
    std::vector<CountryInfo> List() const override;
    absl::StatusOr<CountryInfo> Lookup(uint32_t code) const override;
    absl::StatusOr<CountryInfo> Find(std::string_view text) const override;
    bool Contains(uint32_t code) const override;

    // Insert or replace
    absl::Status Upsert(const CountryInfo& info);

private:
    mutable std::mutex mutex_;
    std::map<uint32_t, CountryInfo> countries_;
};

}  // namespace countryid
