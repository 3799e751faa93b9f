#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "countryid/client/grpc_client.h"
#include "countryid/common/country_uuid.h"
#include "countryid/common/in_memory_country_registry.h"
#include "countryid/server/service.h"

using namespace countryid;
using ::testing::SizeIs;

// Full round trips through GRPCClient against an in-process server.
class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        StartServer();
        client_ = std::make_unique<GRPCClient>(server_address_, std::chrono::seconds(5));
        ASSERT_TRUE(client_->Connect().ok());
    }

    void TearDown() override {
        client_.reset();
        StopServer();
    }

    void StartServer() {
        service_ = std::make_unique<server::IdServiceImpl>(
            registry_, SystemRandomSource::Instance(), SystemClock::Instance());

        int selected_port = 0;
        auto built = server::BuildServer("localhost:0", service_.get(), &selected_port);
        ASSERT_TRUE(built.ok()) << built.status();
        server_ = std::move(*built);
        server_address_ = "localhost:" + std::to_string(selected_port);
    }

    void StopServer() {
        if (server_) {
            server_->Shutdown();
            server_.reset();
        }
        service_.reset();
    }

    InMemoryCountryRegistry registry_;
    std::unique_ptr<server::IdServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::string server_address_;
    std::unique_ptr<GRPCClient> client_;
};

TEST_F(IntegrationTest, ClientConnects) {
    EXPECT_TRUE(client_->IsConnected());
}

TEST_F(IntegrationTest, GenerateThenDecode) {
    auto ids = client_->Generate("JP", 3);
    ASSERT_TRUE(ids.ok()) << ids.status();
    ASSERT_THAT(*ids, SizeIs(3));

    for (const auto& id : *ids) {
        auto decoded = client_->Decode(id);
        ASSERT_TRUE(decoded.ok()) << decoded.status();
        EXPECT_EQ(decoded->id, id);
        EXPECT_EQ(decoded->country_code, 392u);
        EXPECT_TRUE(decoded->known_country);
        EXPECT_EQ(decoded->country.name, "Japan");
        EXPECT_EQ(decoded->timestamp_ns, TimestampNanos(id));
    }
}

TEST_F(IntegrationTest, GenerateByCodeDecodesLocally) {
    auto ids = client_->Generate(804u);
    ASSERT_TRUE(ids.ok());
    ASSERT_THAT(*ids, SizeIs(1));

    auto code = DecodeCountry(ids->front());
    ASSERT_TRUE(code.ok());
    EXPECT_EQ(*code, 804u);
}

TEST_F(IntegrationTest, NumericTextEncodesUnregisteredCode) {
    ASSERT_FALSE(registry_.Contains(999));

    auto ids = client_->Generate(std::string("999"), 2);
    ASSERT_TRUE(ids.ok()) << ids.status();
    ASSERT_THAT(*ids, SizeIs(2));

    for (const auto& id : *ids) {
        auto decoded = client_->Decode(id);
        ASSERT_TRUE(decoded.ok());
        EXPECT_EQ(decoded->country_code, 999u);
        EXPECT_FALSE(decoded->known_country);
    }

    auto registered = client_->Generate(std::string(" 840 "));
    ASSERT_TRUE(registered.ok());
    EXPECT_EQ(*DecodeCountry(registered->front()), 840u);
}

TEST_F(IntegrationTest, ErrorsKeepTheirKind) {
    auto v4 = Uuid::Parse("550e8400-e29b-41d4-a716-446655440000");
    ASSERT_TRUE(v4.ok());

    auto decoded = client_->Decode(*v4);
    ASSERT_FALSE(decoded.ok());
    EXPECT_TRUE(IsVersionMismatch(decoded.status()));

    auto generated = client_->Generate("Atlantis");
    EXPECT_TRUE(absl::IsNotFound(generated.status()));

    auto too_many = client_->Generate(840u, 1001);
    EXPECT_TRUE(absl::IsInvalidArgument(too_many.status()));
}

TEST_F(IntegrationTest, ListCountriesMatchesRegistry) {
    auto countries = client_->ListCountries();
    ASSERT_TRUE(countries.ok());
    EXPECT_EQ(*countries, registry_.List());
}

TEST_F(IntegrationTest, CallsFailAfterDisconnect) {
    client_->Disconnect();
    EXPECT_FALSE(client_->IsConnected());
    EXPECT_TRUE(absl::IsFailedPrecondition(client_->Generate(840u).status()));
}

TEST_F(IntegrationTest, ConcurrentClientsGetUniqueIds) {
    constexpr int kClients = 10;
    constexpr uint32_t kBatch = 100;

    std::mutex mutex;
    absl::flat_hash_set<Uuid> seen;
    std::vector<std::thread> threads;
    for (int c = 0; c < kClients; ++c) {
        threads.emplace_back([&, c] {
            GRPCClient client(server_address_);
            ASSERT_TRUE(client.Connect().ok());
            auto ids = client.Generate(static_cast<uint32_t>(c), kBatch);
            ASSERT_TRUE(ids.ok());
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(ids->begin(), ids->end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(seen.size(), static_cast<size_t>(kClients) * kBatch);
}
