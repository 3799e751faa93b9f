#include "countryid/common/random_source.h"

#include <cerrno>
#include <cstring>

#include <sys/random.h>

#include <absl/strings/str_cat.h>

namespace countryid {

absl::Status SystemRandomSource::Fill(uint8_t* buffer, std::size_t size) {
    std::size_t filled = 0;
    while (filled < size) {
        const ssize_t n = getrandom(buffer + filled, size - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return absl::UnavailableError(
                absl::StrCat("getrandom failed: ", std::strerror(errno)));
        }
        filled += static_cast<std::size_t>(n);
    }
    return absl::OkStatus();
}

SystemRandomSource& SystemRandomSource::Instance() {
    static SystemRandomSource instance;
    return instance;
}

}  // namespace countryid
