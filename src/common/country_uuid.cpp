#include "countryid/common/country_uuid.h"

#include <absl/strings/str_cat.h>

namespace countryid {

namespace {

constexpr uint64_t kNanosPerSecond = 1000000000ULL;

}  // namespace

absl::StatusOr<Uuid> Encode(uint32_t country_code, RandomSource& random, Clock& clock) {
    const uint64_t now_ns = clock.NowUnixNanos();

    Uuid::Bytes bytes;
    auto status = random.Fill(bytes.data(), bytes.size());
    if (!status.ok()) {
        return absl::UnavailableError(
            absl::StrCat("Secure random source failed: ", status.message()));
    }

    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(now_ns >> (56 - 8 * i));
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (kCountryUuidVersion << 4));

    const uint32_t code = country_code & kMaxCountryCode;
    bytes[8] = static_cast<uint8_t>((kRfc4122Variant << 6) | ((code >> 16) & 0x3F));
    bytes[9] = static_cast<uint8_t>(code >> 8);
    bytes[10] = static_cast<uint8_t>(code);

    return Uuid(bytes);
}

absl::StatusOr<Uuid> Encode(uint32_t country_code) {
    return Encode(country_code, SystemRandomSource::Instance(), SystemClock::Instance());
}

absl::StatusOr<uint32_t> DecodeCountry(const Uuid& id) {
    if (id.version() != kCountryUuidVersion) {
        return absl::FailedPreconditionError(
            absl::StrCat("Not a country UUID: version is ", id.version(),
                         ", expected ", kCountryUuidVersion));
    }
    return (static_cast<uint32_t>(id[8] & 0x3F) << 16) |
           (static_cast<uint32_t>(id[9]) << 8) |
           static_cast<uint32_t>(id[10]);
}

uint64_t TimestampNanos(const Uuid& id) {
    uint64_t t = 0;
    for (int i = 0; i < 8; ++i) {
        t = (t << 8) | id[i];
    }
    return t;
}

absl::Time TimestampOf(const Uuid& id) {
    // Split so values above INT64_MAX survive the conversion.
    const uint64_t t = TimestampNanos(id);
    return absl::UnixEpoch() +
           absl::Seconds(static_cast<int64_t>(t / kNanosPerSecond)) +
           absl::Nanoseconds(static_cast<int64_t>(t % kNanosPerSecond));
}

bool IsRandomnessError(const absl::Status& status) {
    return absl::IsUnavailable(status);
}

bool IsVersionMismatch(const absl::Status& status) {
    return absl::IsFailedPrecondition(status);
}

}  // namespace countryid
