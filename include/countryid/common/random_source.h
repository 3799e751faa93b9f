#pragma once

#include <cstddef>
#include <cstdint>

#include <absl/status/status.h>

namespace countryid {

/* Source of cryptographically secure random bytes. */
/* Implementations must be safe to call from several threads at once. */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Fill `size` bytes at `buffer`. Returns UnavailableError on failure,
    // in which case the buffer contents are unspecified.
    virtual absl::Status Fill(uint8_t* buffer, std::size_t size) = 0;
};

/* Kernel CSPRNG via getrandom(2). Stateless. */
class SystemRandomSource : public RandomSource {
public:
    SystemRandomSource() = default;
    ~SystemRandomSource() override = default;

    absl::Status Fill(uint8_t* buffer, std::size_t size) override;

    // Process-wide instance
    static SystemRandomSource& Instance();
};

}  // namespace countryid
