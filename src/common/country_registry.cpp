#include "countryid/common/country_registry.h"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "countryid/common/country_uuid.h"

namespace countryid {

bool operator==(const CountryInfo& lhs, const CountryInfo& rhs) {
    return lhs.code == rhs.code && lhs.name == rhs.name &&
           lhs.alpha2 == rhs.alpha2 && lhs.alpha3 == rhs.alpha3;
}

CountryInfo UnknownCountry() {
    CountryInfo info;
    info.code = kUnknownCountryCode;
    info.name = "Unknown";
    return info;
}

bool MatchesCountry(const CountryInfo& info, std::string_view text) {
    text = absl::StripAsciiWhitespace(text);
    if (text.empty()) {
        return false;
    }
    return (!info.alpha2.empty() && absl::EqualsIgnoreCase(info.alpha2, text)) ||
           (!info.alpha3.empty() && absl::EqualsIgnoreCase(info.alpha3, text)) ||
           absl::EqualsIgnoreCase(info.name, text);
}

absl::Status ValidateCountryInfo(const CountryInfo& info) {
    if (info.code > kMaxCountryCode) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Country code ", info.code, " does not fit in ", kCountryCodeBits, " bits"));
    }
    if (info.name.empty()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Country ", info.code, " has no name"));
    }
    return absl::OkStatus();
}

bool ParseCountryCode(std::string_view text, uint32_t* code) {
    text = absl::StripAsciiWhitespace(text);
    if (text.empty() || !absl::ascii_isdigit(static_cast<unsigned char>(text.front()))) {
        return false;
    }
    uint32_t value = 0;
    if (!absl::SimpleAtoi(text, &value) || value > kMaxCountryCode) {
        return false;
    }
    *code = value;
    return true;
}

}  // namespace countryid
