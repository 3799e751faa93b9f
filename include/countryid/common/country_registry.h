#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace countryid {

struct CountryInfo {
    uint32_t code = 0;
    std::string name;
    std::string alpha2;
    std::string alpha3;
};

bool operator==(const CountryInfo& lhs, const CountryInfo& rhs);

// Code 0 means "unknown country"
inline constexpr uint32_t kUnknownCountryCode = 0;

CountryInfo UnknownCountry();

/* Maps integer country codes to descriptive metadata. */
/* The identifier codec never consults it; callers use it to pick a code */
/* before encoding and to describe one after decoding. */
class CountryRegistry {
public:
    virtual ~CountryRegistry() = default;

    // Codes in ascending order
    virtual std::vector<uint32_t> ListCodes() const = 0;

    // Entries in ascending code order
    virtual std::vector<CountryInfo> List() const = 0;

    virtual absl::StatusOr<CountryInfo> Lookup(uint32_t code) const = 0;

    // Case-insensitive match on alpha-2, alpha-3 or name. A decimal string
    // is looked up as a numeric code.
    virtual absl::StatusOr<CountryInfo> Find(std::string_view text) const = 0;

    virtual bool Contains(uint32_t code) const = 0;
};

// Shared by registry implementations for Find()
bool MatchesCountry(const CountryInfo& info, std::string_view text);

// Rejects codes wider than the identifier's country field and empty names
absl::Status ValidateCountryInfo(const CountryInfo& info);

// True if `text` is a decimal number that fits in a country code
bool ParseCountryCode(std::string_view text, uint32_t* code);

}  // namespace countryid
