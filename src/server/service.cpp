#include "countryid/server/service.h"

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "countryid/common/country_uuid.h"
#include "countryid/common/wire.h"

namespace countryid::server {

IdServiceImpl::IdServiceImpl(const CountryRegistry& registry,
                             RandomSource& random,
                             Clock& clock,
                             const ServiceConfig& config)
    : registry_(registry)
    , random_(random)
    , clock_(clock)
    , config_(config) {}

IdServiceImpl::~IdServiceImpl() = default;

absl::StatusOr<CountryInfo> IdServiceImpl::ResolveCountry(const GenerateRequest& request) const {
    uint32_t code = request.country_code();
    if (!request.country().empty() && !ParseCountryCode(request.country(), &code)) {
        return registry_.Find(request.country());
    }

    if (code > kMaxCountryCode) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Country code ", code, " does not fit in ", kCountryCodeBits, " bits"));
    }

    auto info = registry_.Lookup(code);
    if (info.ok()) {
        return info;
    }
    if (config_.strict_countries || !absl::IsNotFound(info.status())) {
        return info.status();
    }

    // Unregistered but representable: encode it anyway
    CountryInfo unregistered;
    unregistered.code = code;
    return unregistered;
}

grpc::Status IdServiceImpl::Generate(grpc::ServerContext* context,
                                     const GenerateRequest* request,
                                     GenerateResponse* response) {
    const uint32_t count = request->count() == 0 ? 1 : request->count();
    if (count > config_.max_batch) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            absl::StrCat("count ", count, " exceeds max_batch ", config_.max_batch));
    }

    auto country = ResolveCountry(*request);
    if (!country.ok()) {
        LOG(INFO) << "[Server] Generate rejected from " << context->peer()
                  << ": " << country.status().message();
        return ToGrpcStatus(country.status());
    }

    for (uint32_t i = 0; i < count; ++i) {
        auto id = Encode(country->code, random_, clock_);
        if (!id.ok()) {
            LOG(ERROR) << "[Server] Encode failed: " << id.status().message();
            response->clear_ids();
            return ToGrpcStatus(id.status());
        }
        ToProto(*id, response->add_ids());
    }
    ToProto(*country, response->mutable_country());

    LOG(INFO) << "[Server] Generated " << count << " id(s) for country "
              << country->code << " (" << context->peer() << ")";
    return grpc::Status::OK;
}

grpc::Status IdServiceImpl::Decode(grpc::ServerContext* context,
                                   const DecodeRequest* request,
                                   DecodeResponse* response) {
    auto id = FromProto(request->id());
    if (!id.ok()) {
        return ToGrpcStatus(id.status());
    }

    auto code = DecodeCountry(*id);
    if (!code.ok()) {
        LOG(INFO) << "[Server] Decode of " << *id << " rejected: " << code.status().message();
        return ToGrpcStatus(code.status());
    }

    ToProto(*id, response->mutable_id());
    response->set_country_code(*code);
    response->set_timestamp_ns(TimestampNanos(*id));

    auto info = registry_.Lookup(*code);
    if (!info.ok() && !absl::IsNotFound(info.status())) {
        LOG(WARNING) << "[Server] Registry lookup for " << *code
                     << " failed: " << info.status().message();
    }
    response->set_known_country(info.ok());
    if (info.ok()) {
        ToProto(*info, response->mutable_country());
    } else {
        response->mutable_country()->set_code(*code);
    }

    LOG(INFO) << "[Server] Decoded " << *id << " -> " << *code
              << " (" << context->peer() << ")";
    return grpc::Status::OK;
}

grpc::Status IdServiceImpl::ListCountries(grpc::ServerContext* context,
                                          const ListCountriesRequest* request,
                                          ListCountriesResponse* response) {
    (void)request;
    for (const auto& info : registry_.List()) {
        ToProto(info, response->add_countries());
    }
    LOG(INFO) << "[Server] Listed " << response->countries_size()
              << " countries (" << context->peer() << ")";
    return grpc::Status::OK;
}

absl::StatusOr<std::unique_ptr<grpc::Server>> BuildServer(const std::string& address,
                                                          IdServiceImpl* service,
                                                          int* selected_port) {
    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), selected_port);
    builder.RegisterService(service);

    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
    if (!server) {
        return absl::UnavailableError(absl::StrCat("Failed to listen on ", address));
    }
    return server;
}

}  // namespace countryid::server
