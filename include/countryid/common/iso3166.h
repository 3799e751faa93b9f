#pragma once

#include <vector>

#include "countryid/common/country_registry.h"

namespace countryid {

// Built-in ISO 3166-1 table in ascending numeric order, without the
// "Unknown" entry
const std::vector<CountryInfo>& Iso3166Countries();

}  // namespace countryid
