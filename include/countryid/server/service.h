#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <absl/status/statusor.h>
#include <grpcpp/grpcpp.h>
#include "countryid.grpc.pb.h"

#include "countryid/common/clock.h"
#include "countryid/common/country_registry.h"
#include "countryid/common/random_source.h"

namespace countryid::server {

/// Configuration for the identifier service
struct ServiceConfig {
    uint32_t max_batch = 1000;       // Upper bound for GenerateRequest.count
    bool strict_countries = false;   // Reject codes missing from the registry
};

/// gRPC service issuing and inspecting country UUIDs
class IdServiceImpl final : public IdService::Service {
public:
    IdServiceImpl(const CountryRegistry& registry,
                  RandomSource& random,
                  Clock& clock,
                  const ServiceConfig& config = {});
    ~IdServiceImpl() override;

    grpc::Status Generate(grpc::ServerContext* context,
                          const GenerateRequest* request,
                          GenerateResponse* response) override;

    grpc::Status Decode(grpc::ServerContext* context,
                        const DecodeRequest* request,
                        DecodeResponse* response) override;

    grpc::Status ListCountries(grpc::ServerContext* context,
                               const ListCountriesRequest* request,
                               ListCountriesResponse* response) override;

private:
    // Resolves the country named by a GenerateRequest
    absl::StatusOr<CountryInfo> ResolveCountry(const GenerateRequest& request) const;

    const CountryRegistry& registry_;
    RandomSource& random_;
    Clock& clock_;
    ServiceConfig config_;
};

/// Binds `address` and starts serving `service`.
/// Returns Unavailable when the address cannot be bound.
absl::StatusOr<std::unique_ptr<grpc::Server>> BuildServer(const std::string& address,
                                                          IdServiceImpl* service,
                                                          int* selected_port = nullptr);

}  // namespace countryid::server
