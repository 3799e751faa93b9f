#pragma once

#include <cstdint>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "countryid/common/clock.h"
#include "countryid/common/random_source.h"
#include "countryid/common/uuid.h"

namespace countryid {

// Layout of a country UUID (UUID version 8, big-endian):
//
//   bytes 0-7   unix_ts_ns   64-bit nanosecond timestamp
//   byte  6     version      top nibble, always 0b1000 (overwrites ts bits)
//               rand_a       bottom nibble is whatever the random fill left
//   byte  8     variant      top 2 bits, always 0b10
//   bytes 8-10  country      22 bits: byte8[5:0], byte9, byte10
//   bytes 11-15 rand_b       random
inline constexpr int kCountryUuidVersion = 8;
inline constexpr int kRfc4122Variant = 0b10;
inline constexpr uint32_t kCountryCodeBits = 22;
inline constexpr uint32_t kMaxCountryCode = (1U << kCountryCodeBits) - 1;  // 4194303

/// Builds a new identifier for `country_code`. Codes wider than 22 bits are
/// masked, not rejected. Fails with a randomness error (kUnavailable) if the
/// random source fails; no partial identifier is ever returned.
absl::StatusOr<Uuid> Encode(uint32_t country_code, RandomSource& random, Clock& clock);

/// Same as above with the system random source and system clock.
absl::StatusOr<Uuid> Encode(uint32_t country_code);

/// Extracts the country code. Fails with a version mismatch
/// (kFailedPrecondition) unless the version nibble is 8. Variant bits are
/// not checked.
absl::StatusOr<uint32_t> DecodeCountry(const Uuid& id);

/// Raw big-endian value of bytes 0-7. Never fails.
uint64_t TimestampNanos(const Uuid& id);

/// TimestampNanos() as a point in time. Never fails.
absl::Time TimestampOf(const Uuid& id);

bool IsRandomnessError(const absl::Status& status);
bool IsVersionMismatch(const absl::Status& status);

}  // namespace countryid
