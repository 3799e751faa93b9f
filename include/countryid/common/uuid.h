#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <absl/status/statusor.h>

namespace countryid {

/* 128-bit identifier stored as 16 bytes in network (big-endian) order. */
/* The default value is the nil UUID (all zeros). */
class Uuid {
public:
    static constexpr std::size_t kSize = 16;
    using Bytes = std::array<uint8_t, kSize>;

    constexpr Uuid() : bytes_{} {}
    explicit constexpr Uuid(const Bytes& bytes) : bytes_(bytes) {}

    static Uuid FromBytes(const Bytes& bytes);

    // Fails unless `raw` holds exactly 16 bytes
    static absl::StatusOr<Uuid> FromBytes(std::string_view raw);

    // Accepts 8-4-4-4-12 or 32 hex digits, optionally wrapped in {} or
    // prefixed with urn:uuid:
    static absl::StatusOr<Uuid> Parse(std::string_view text);

    const Bytes& bytes() const { return bytes_; }
    uint8_t operator[](std::size_t i) const { return bytes_[i]; }

    // Raw 16 bytes, for protobuf `bytes` fields and BLOB columns
    std::string ToBinary() const;

    // Lower-case canonical form
    std::string ToString() const;

    int version() const { return bytes_[6] >> 4; }
    int variant() const { return bytes_[8] >> 6; }
    bool IsNil() const;

    friend bool operator==(const Uuid& lhs, const Uuid& rhs) {
        return lhs.bytes_ == rhs.bytes_;
    }
    friend bool operator!=(const Uuid& lhs, const Uuid& rhs) {
        return !(lhs == rhs);
    }
    friend bool operator<(const Uuid& lhs, const Uuid& rhs) {
        return lhs.bytes_ < rhs.bytes_;
    }

    template <typename H>
    friend H AbslHashValue(H h, const Uuid& uuid) {
        return H::combine(std::move(h), uuid.bytes_);
    }

private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

}  // namespace countryid
