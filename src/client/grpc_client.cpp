#include "countryid/client/grpc_client.h"

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "countryid/common/wire.h"

namespace countryid {

GRPCClient::GRPCClient(const std::string& server_address, std::chrono::milliseconds timeout)
    : server_address_(server_address)
    , timeout_(timeout) {}

GRPCClient::~GRPCClient() {
    Disconnect();
}

absl::Status GRPCClient::Connect() {
    if (connected_) {
        return absl::OkStatus();
    }

    channel_ = grpc::CreateChannel(server_address_, grpc::InsecureChannelCredentials());
    if (!channel_) {
        return absl::InternalError("Failed to create gRPC channel");
    }

    stub_ = IdService::NewStub(channel_);
    if (!stub_) {
        channel_.reset();
        return absl::InternalError("Failed to create gRPC stub");
    }

    auto deadline = std::chrono::system_clock::now() + timeout_;
    if (!channel_->WaitForConnected(deadline)) {
        stub_.reset();
        channel_.reset();
        return absl::UnavailableError(
            absl::StrCat("Failed to connect to server: ", server_address_));
    }

    LOG(INFO) << "[Client] Connected to " << server_address_;
    connected_ = true;
    return absl::OkStatus();
}

void GRPCClient::Disconnect() {
    if (!connected_) {
        return;
    }
    stub_.reset();
    channel_.reset();
    connected_ = false;
    LOG(INFO) << "[Client] Disconnected from " << server_address_;
}

bool GRPCClient::IsConnected() const {
    return connected_;
}

void GRPCClient::PrepareContext(grpc::ClientContext* context) const {
    context->set_deadline(std::chrono::system_clock::now() + timeout_);
}

absl::StatusOr<std::vector<Uuid>> GRPCClient::Generate(const std::string& country, uint32_t count) {
    // Numeric text is a code, not a registry name
    uint32_t code = 0;
    if (ParseCountryCode(country, &code)) {
        return Generate(code, count);
    }

    GenerateRequest request;
    request.set_country(country);
    request.set_count(count);
    return SendGenerate(request);
}

absl::StatusOr<std::vector<Uuid>> GRPCClient::Generate(uint32_t country_code, uint32_t count) {
    GenerateRequest request;
    request.set_country_code(country_code);
    request.set_count(count);
    return SendGenerate(request);
}

absl::StatusOr<std::vector<Uuid>> GRPCClient::SendGenerate(const GenerateRequest& request) {
    if (!connected_) {
        return absl::FailedPreconditionError("Not connected to server");
    }

    grpc::ClientContext context;
    PrepareContext(&context);
    GenerateResponse response;
    auto status = FromGrpcStatus(stub_->Generate(&context, request, &response));
    if (!status.ok()) {
        LOG(WARNING) << "[Client] Generate failed: " << status;
        return status;
    }

    std::vector<Uuid> ids;
    ids.reserve(response.ids_size());
    for (const auto& id : response.ids()) {
        auto uuid = FromProto(id);
        if (!uuid.ok()) {
            return uuid.status();
        }
        ids.push_back(*uuid);
    }
    return ids;
}

absl::StatusOr<DecodedId> GRPCClient::Decode(const Uuid& id) {
    if (!connected_) {
        return absl::FailedPreconditionError("Not connected to server");
    }

    DecodeRequest request;
    ToProto(id, request.mutable_id());

    grpc::ClientContext context;
    PrepareContext(&context);
    DecodeResponse response;
    auto status = FromGrpcStatus(stub_->Decode(&context, request, &response));
    if (!status.ok()) {
        LOG(INFO) << "[Client] Decode of " << id << " failed: " << status;
        return status;
    }

    DecodedId decoded;
    decoded.id = id;
    decoded.country_code = response.country_code();
    decoded.timestamp_ns = response.timestamp_ns();
    decoded.country = FromProto(response.country());
    decoded.known_country = response.known_country();
    return decoded;
}

absl::StatusOr<std::vector<CountryInfo>> GRPCClient::ListCountries() {
    if (!connected_) {
        return absl::FailedPreconditionError("Not connected to server");
    }

    grpc::ClientContext context;
    PrepareContext(&context);
    ListCountriesResponse response;
    auto status = FromGrpcStatus(
        stub_->ListCountries(&context, ListCountriesRequest(), &response));
    if (!status.ok()) {
        return status;
    }

    std::vector<CountryInfo> countries;
    countries.reserve(response.countries_size());
    for (const auto& country : response.countries()) {
        countries.push_back(FromProto(country));
    }
    return countries;
}

}  // namespace countryid
