#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "countryid.grpc.pb.h"
#include "countryid/common/country_registry.h"
#include "countryid/common/uuid.h"

namespace countryid {

struct DecodedId {
    Uuid id;
    uint32_t country_code = 0;
    uint64_t timestamp_ns = 0;
    CountryInfo country;
    bool known_country = false;
};

class GRPCClient {
public:
    explicit GRPCClient(const std::string& server_address,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5));
    ~GRPCClient();

    GRPCClient(const GRPCClient&) = delete;
    GRPCClient& operator=(const GRPCClient&) = delete;
    GRPCClient(GRPCClient&&) = delete;
    GRPCClient& operator=(GRPCClient&&) = delete;

    absl::Status Connect();
    void Disconnect();
    bool IsConnected() const;

    // `country` is alpha-2, alpha-3, name or decimal code
    absl::StatusOr<std::vector<Uuid>> Generate(const std::string& country, uint32_t count = 1);
    absl::StatusOr<std::vector<Uuid>> Generate(uint32_t country_code, uint32_t count = 1);

    absl::StatusOr<DecodedId> Decode(const Uuid& id);

    absl::StatusOr<std::vector<CountryInfo>> ListCountries();

private:
    absl::StatusOr<std::vector<Uuid>> SendGenerate(const GenerateRequest& request);
    void PrepareContext(grpc::ClientContext* context) const;

    std::string server_address_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<IdService::Stub> stub_;

    std::atomic<bool> connected_{false};
};

}  // namespace countryid
