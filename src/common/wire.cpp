#include "countryid/common/wire.h"

#include <string>

namespace countryid {

void ToProto(const Uuid& uuid, Identifier* out) {
    out->set_value(uuid.ToBinary());
    out->set_text(uuid.ToString());
}

void ToProto(const CountryInfo& info, Country* out) {
    out->set_code(info.code);
    out->set_name(info.name);
    out->set_alpha2(info.alpha2);
    out->set_alpha3(info.alpha3);
}

absl::StatusOr<Uuid> FromProto(const Identifier& id) {
    if (!id.value().empty()) {
        return Uuid::FromBytes(id.value());
    }
    if (!id.text().empty()) {
        return Uuid::Parse(id.text());
    }
    return absl::InvalidArgumentError("Identifier is empty");
}

CountryInfo FromProto(const Country& country) {
    CountryInfo info;
    info.code = country.code();
    info.name = country.name();
    info.alpha2 = country.alpha2();
    info.alpha3 = country.alpha3();
    return info;
}

// absl::StatusCode and grpc::StatusCode share numbering.
grpc::Status ToGrpcStatus(const absl::Status& status) {
    if (status.ok()) {
        return grpc::Status::OK;
    }
    return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
                        std::string(status.message()));
}

absl::Status FromGrpcStatus(const grpc::Status& status) {
    if (status.ok()) {
        return absl::OkStatus();
    }
    return absl::Status(static_cast<absl::StatusCode>(status.error_code()),
                        status.error_message());
}

}  // namespace countryid
