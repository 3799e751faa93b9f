#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <thread>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "countryid/common/country_uuid.h"
#include "fakes.h"

using namespace countryid;
using countryid::testing::ConstantRandomSource;
using countryid::testing::FailingRandomSource;
using countryid::testing::FakeClock;
using ::testing::_;
using ::testing::Return;

namespace {

class MockRandomSource : public RandomSource {
public:
    MOCK_METHOD(absl::Status, Fill, (uint8_t* buffer, std::size_t size), (override));
};

Uuid MakeVersion4() {
    Uuid::Bytes bytes = {0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
                         0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00};
    return Uuid(bytes);
}

}  // namespace

// ============================================================================
// Layout
// ============================================================================

TEST(CountryUuidTest, ExactLayoutWithFixedInputs) {
    FakeClock clock(0x0123456789ABCDEFULL);
    ConstantRandomSource random(0xFF);

    auto id = Encode(840, random, clock);
    ASSERT_TRUE(id.ok()) << id.status();

    // Byte 6 keeps its low nibble (0xD) under the version nibble.
    EXPECT_EQ(id->ToString(), "01234567-89ab-8def-8003-48ffffffffff");
    EXPECT_EQ(TimestampNanos(*id), 0x0123456789AB8DEFULL);
}

TEST(CountryUuidTest, MaximumCodeFillsAllCountryBits) {
    FakeClock clock(0);
    ConstantRandomSource random(0x00);

    auto id = Encode(kMaxCountryCode, random, clock);
    ASSERT_TRUE(id.ok());

    EXPECT_EQ((*id)[8], 0xBF);
    EXPECT_EQ((*id)[9], 0xFF);
    EXPECT_EQ((*id)[10], 0xFF);
    EXPECT_EQ(id->ToString(), "00000000-0000-8000-bfff-ff0000000000");
}

TEST(CountryUuidTest, VersionAndVariantAlwaysSet) {
    for (uint8_t fill : {0x00, 0x5A, 0xA5, 0xFF}) {
        FakeClock clock(std::numeric_limits<uint64_t>::max());
        ConstantRandomSource random(fill);
        for (uint32_t code : {0u, 1u, 76u, 156u, 250u, 276u, 356u, 392u, 643u, 840u, kMaxCountryCode}) {
            auto id = Encode(code, random, clock);
            ASSERT_TRUE(id.ok());
            EXPECT_EQ(id->version(), 8) << *id;
            EXPECT_EQ(id->variant(), 2) << *id;
        }
    }
}

TEST(CountryUuidTest, CodeAboveRangeIsMasked) {
    FakeClock clock(1);
    ConstantRandomSource random(0x00);

    auto id = Encode(0x400000u | 5u, random, clock);
    ASSERT_TRUE(id.ok());

    auto code = DecodeCountry(*id);
    ASSERT_TRUE(code.ok());
    EXPECT_EQ(*code, 5u);
    EXPECT_EQ(id->variant(), 2);
}

// ============================================================================
// Round trip
// ============================================================================

TEST(CountryUuidTest, DecodeReturnsEncodedCountry) {
    for (uint32_t code : {0u, 4u, 36u, 76u, 124u, 156u, 250u, 276u, 356u, 380u,
                          392u, 484u, 643u, 724u, 804u, 826u, 840u, 1000u,
                          65535u, 65536u, kMaxCountryCode}) {
        auto id = Encode(code);
        ASSERT_TRUE(id.ok()) << id.status();

        auto decoded = DecodeCountry(*id);
        ASSERT_TRUE(decoded.ok()) << decoded.status();
        EXPECT_EQ(*decoded, code);
    }
}

TEST(CountryUuidTest, DecodeSurvivesTextRoundTrip) {
    auto id = Encode(643);
    ASSERT_TRUE(id.ok());

    auto parsed = Uuid::Parse(id->ToString());
    ASSERT_TRUE(parsed.ok());
    auto decoded = DecodeCountry(*parsed);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, 643u);
}

TEST(CountryUuidTest, DecodeRejectsOtherVersions) {
    auto decoded = DecodeCountry(MakeVersion4());
    ASSERT_FALSE(decoded.ok());
    EXPECT_TRUE(IsVersionMismatch(decoded.status()));
    EXPECT_FALSE(IsRandomnessError(decoded.status()));
    EXPECT_THAT(std::string(decoded.status().message()), ::testing::HasSubstr("version is 4"));

    EXPECT_TRUE(IsVersionMismatch(DecodeCountry(Uuid()).status()));
}

TEST(CountryUuidTest, DecodeIgnoresVariant) {
    auto id = Encode(840);
    ASSERT_TRUE(id.ok());

    Uuid::Bytes bytes = id->bytes();
    bytes[8] &= 0x3F;  // variant 00
    auto decoded = DecodeCountry(Uuid(bytes));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, 840u);
}

// ============================================================================
// Random source failures
// ============================================================================

TEST(CountryUuidTest, RandomFailureIsReported) {
    FakeClock clock(42);
    FailingRandomSource random;

    auto id = Encode(840, random, clock);
    ASSERT_FALSE(id.ok());
    EXPECT_TRUE(IsRandomnessError(id.status()));
    EXPECT_FALSE(IsVersionMismatch(id.status()));
}

TEST(CountryUuidTest, RequestsSixteenRandomBytes) {
    FakeClock clock(42);
    MockRandomSource random;
    EXPECT_CALL(random, Fill(_, Uuid::kSize)).WillOnce(Return(absl::OkStatus()));

    EXPECT_TRUE(Encode(1, random, clock).ok());
}

// ============================================================================
// Timestamp
// ============================================================================

TEST(CountryUuidTest, TimestampWithinCallWindow) {
    const absl::Time before = absl::Now();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    auto id = Encode(840);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    const absl::Time after = absl::Now();

    ASSERT_TRUE(id.ok());
    const absl::Time ts = TimestampOf(*id);
    EXPECT_GT(ts, before);
    EXPECT_LT(ts, after);
}

TEST(CountryUuidTest, TimestampAdvances) {
    auto first = Encode(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    auto second = Encode(1);

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_GT(TimestampOf(*second), TimestampOf(*first));
}

TEST(CountryUuidTest, TimestampFollowsInjectedClock) {
    FakeClock clock(0);
    ConstantRandomSource random(0x00);

    // Bits 12-15 hold the version, so keep them at 0b1000 here
    clock.Set(0x8000 + 100);
    auto first = Encode(840, random, clock);
    clock.Advance(5);
    auto second = Encode(840, random, clock);
    clock.Set(0x1234567800008000ULL);
    auto third = Encode(840, random, clock);

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(third.ok());
    EXPECT_EQ(TimestampNanos(*first), 0x8064u);
    EXPECT_EQ(TimestampNanos(*second), 0x8069u);
    EXPECT_EQ(TimestampNanos(*third), 0x1234567800008000ULL);
    EXPECT_EQ(TimestampOf(*second) - TimestampOf(*first), absl::Nanoseconds(5));
}

TEST(CountryUuidTest, TimestampOfEpoch) {
    EXPECT_EQ(TimestampOf(Uuid()), absl::UnixEpoch());

    // Encoding at the epoch still stamps the version over bits 12-15
    FakeClock clock(0);
    ConstantRandomSource random(0x00);
    auto id = Encode(0, random, clock);
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(TimestampOf(*id), absl::UnixEpoch() + absl::Nanoseconds(0x8000));
}

TEST(CountryUuidTest, TimestampOfMaxValueIsExact) {
    Uuid::Bytes bytes;
    bytes.fill(0xFF);
    const Uuid id(bytes);

    EXPECT_EQ(TimestampNanos(id), std::numeric_limits<uint64_t>::max());
    const absl::Time expected = absl::UnixEpoch() +
                                absl::Seconds(18446744073LL) +
                                absl::Nanoseconds(709551615);
    EXPECT_EQ(TimestampOf(id), expected);
    EXPECT_EQ(absl::ToUnixSeconds(TimestampOf(id)), 18446744073LL);
}

TEST(CountryUuidTest, TimestampOfNeverChecksVersion) {
    EXPECT_EQ(TimestampNanos(MakeVersion4()), 0x550e8400e29b41d4ULL);
}

// ============================================================================
// Uniqueness
// ============================================================================

TEST(CountryUuidTest, SequentialIdsAreUnique) {
    absl::flat_hash_set<Uuid> seen;
    for (int i = 0; i < 1000; ++i) {
        auto id = Encode(840);
        ASSERT_TRUE(id.ok());
        EXPECT_TRUE(seen.insert(*id).second) << "duplicate " << *id;
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(CountryUuidTest, ConcurrentIdsAreUnique) {
    constexpr int kThreads = 100;
    constexpr int kPerThread = 100;

    std::vector<std::vector<Uuid>> results(kThreads);
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &results] {
            results[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                auto id = Encode(static_cast<uint32_t>(i % 250));
                if (id.ok()) {
                    results[t].push_back(*id);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    absl::flat_hash_set<Uuid> seen;
    for (int t = 0; t < kThreads; ++t) {
        ASSERT_EQ(results[t].size(), static_cast<size_t>(kPerThread));
        for (int i = 0; i < kPerThread; ++i) {
            const Uuid& id = results[t][i];
            seen.insert(id);
            auto code = DecodeCountry(id);
            ASSERT_TRUE(code.ok());
            EXPECT_EQ(*code, static_cast<uint32_t>(i % 250));
        }
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(kThreads * kPerThread));
}
