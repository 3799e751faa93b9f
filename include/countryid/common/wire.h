#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <grpcpp/grpcpp.h>

#include "countryid.pb.h"
#include "countryid/common/country_registry.h"
#include "countryid/common/uuid.h"

namespace countryid {

void ToProto(const Uuid& uuid, Identifier* out);
void ToProto(const CountryInfo& info, Country* out);

// Uses `value` when present, otherwise parses `text`
absl::StatusOr<Uuid> FromProto(const Identifier& id);
CountryInfo FromProto(const Country& country);

grpc::Status ToGrpcStatus(const absl::Status& status);
absl::Status FromGrpcStatus(const grpc::Status& status);

}  // namespace countryid
