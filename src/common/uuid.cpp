#include "countryid/common/uuid.h"

#include <iomanip>
#include <sstream>

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace countryid {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

absl::Status MalformedError(std::string_view text) {
    return absl::InvalidArgumentError(absl::StrCat("Malformed UUID: \"", text, "\""));
}

}  // namespace

Uuid Uuid::FromBytes(const Bytes& bytes) {
    return Uuid(bytes);
}

absl::StatusOr<Uuid> Uuid::FromBytes(std::string_view raw) {
    if (raw.size() != kSize) {
        return absl::InvalidArgumentError(
            absl::StrCat("UUID must be exactly ", kSize, " bytes, got ", raw.size()));
    }
    Bytes bytes;
    for (std::size_t i = 0; i < kSize; ++i) {
        bytes[i] = static_cast<uint8_t>(raw[i]);
    }
    return Uuid(bytes);
}

absl::StatusOr<Uuid> Uuid::Parse(std::string_view text) {
    std::string_view body = absl::StripAsciiWhitespace(text);

    if (absl::StartsWithIgnoreCase(body, "urn:uuid:")) {
        body.remove_prefix(9);
    } else if (body.size() >= 2 && body.front() == '{' && body.back() == '}') {
        body = body.substr(1, body.size() - 2);
    }

    const bool dashed = body.size() == 36;
    if (!dashed && body.size() != 32) {
        return MalformedError(text);
    }

    Bytes bytes{};
    std::size_t nibble = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (dashed && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (c != '-') {
                return MalformedError(text);
            }
            continue;
        }
        const int v = HexValue(c);
        if (v < 0) {
            return MalformedError(text);
        }
        if (nibble % 2 == 0) {
            bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
        } else {
            bytes[nibble / 2] |= static_cast<uint8_t>(v);
        }
        ++nibble;
    }

    return Uuid(bytes);
}

std::string Uuid::ToBinary() const {
    return std::string(reinterpret_cast<const char*>(bytes_.data()), kSize);
}

std::string Uuid::ToString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < kSize; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(bytes_[i]);
    }
    return oss.str();
}

bool Uuid::IsNil() const {
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.ToString();
}

}  // namespace countryid
