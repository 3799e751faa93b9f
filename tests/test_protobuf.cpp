#include <gtest/gtest.h>
#include "countryid.pb.h"
#include "countryid.grpc.pb.h"
#include <google/protobuf/util/message_differencer.h>

#include "countryid/common/wire.h"

using namespace countryid;

namespace {

Uuid SampleUuid() {
    Uuid::Bytes bytes = {0x01, 0x85, 0xe4, 0xc2, 0x7a, 0x3b, 0x8c, 0x11,
                         0x80, 0x03, 0x48, 0xa1, 0xb2, 0xc3, 0xd4, 0xe5};
    return Uuid(bytes);
}

}  // namespace

// Identifier carries both encodings
TEST(ProtobufMessageTest, IdentifierFromUuid) {
    Identifier id;
    ToProto(SampleUuid(), &id);

    EXPECT_EQ(id.value().size(), Uuid::kSize);
    EXPECT_EQ(id.text(), "0185e4c2-7a3b-8c11-8003-48a1b2c3d4e5");

    auto restored = FromProto(id);
    ASSERT_TRUE(restored.ok());
    EXPECT_EQ(*restored, SampleUuid());
}

TEST(ProtobufMessageTest, IdentifierSurvivesSerialization) {
    Identifier id;
    ToProto(SampleUuid(), &id);

    std::string serialized;
    ASSERT_TRUE(id.SerializeToString(&serialized));

    Identifier parsed;
    ASSERT_TRUE(parsed.ParseFromString(serialized));
    EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(id, parsed));
}

TEST(ProtobufMessageTest, IdentifierPrefersBinaryValue) {
    Identifier id;
    id.set_value(SampleUuid().ToBinary());
    id.set_text("00000000-0000-0000-0000-000000000000");

    auto restored = FromProto(id);
    ASSERT_TRUE(restored.ok());
    EXPECT_EQ(*restored, SampleUuid());
}

TEST(ProtobufMessageTest, IdentifierFallsBackToText) {
    Identifier id;
    id.set_text("0185E4C2-7A3B-8C11-8003-48A1B2C3D4E5");

    auto restored = FromProto(id);
    ASSERT_TRUE(restored.ok());
    EXPECT_EQ(*restored, SampleUuid());
}

TEST(ProtobufMessageTest, MalformedIdentifiersRejected) {
    EXPECT_TRUE(absl::IsInvalidArgument(FromProto(Identifier()).status()));

    Identifier short_value;
    short_value.set_value("0123456789");
    EXPECT_TRUE(absl::IsInvalidArgument(FromProto(short_value).status()));

    Identifier bad_text;
    bad_text.set_text("definitely-not-a-uuid");
    EXPECT_TRUE(absl::IsInvalidArgument(FromProto(bad_text).status()));
}

TEST(ProtobufMessageTest, CountryConversion) {
    const CountryInfo info{392, "Japan", "JP", "JPN"};

    Country country;
    ToProto(info, &country);
    EXPECT_EQ(country.code(), 392u);
    EXPECT_EQ(country.name(), "Japan");
    EXPECT_EQ(country.alpha2(), "JP");
    EXPECT_EQ(country.alpha3(), "JPN");

    EXPECT_EQ(FromProto(country), info);
}

TEST(ProtobufMessageTest, GenerateRequestDefaults) {
    GenerateRequest request;
    EXPECT_EQ(request.country_code(), 0u);
    EXPECT_TRUE(request.country().empty());
    EXPECT_EQ(request.count(), 0u);
}

TEST(ProtobufMessageTest, DecodeResponseFields) {
    DecodeResponse response;
    ToProto(SampleUuid(), response.mutable_id());
    response.set_country_code(840);
    response.set_timestamp_ns(0xFFFFFFFFFFFFFFFFULL);
    response.set_known_country(true);
    ToProto(CountryInfo{840, "United States", "US", "USA"}, response.mutable_country());

    std::string serialized;
    ASSERT_TRUE(response.SerializeToString(&serialized));
    DecodeResponse parsed;
    ASSERT_TRUE(parsed.ParseFromString(serialized));

    EXPECT_EQ(parsed.timestamp_ns(), 0xFFFFFFFFFFFFFFFFULL);
    EXPECT_EQ(parsed.country().alpha3(), "USA");
    EXPECT_TRUE(parsed.known_country());
}

// ============================================================================
// Status mapping
// ============================================================================

TEST(StatusMappingTest, OkMapsToOk) {
    EXPECT_TRUE(ToGrpcStatus(absl::OkStatus()).ok());
    EXPECT_TRUE(FromGrpcStatus(grpc::Status::OK).ok());
}

TEST(StatusMappingTest, CodesAndMessagesPreserved) {
    const std::pair<absl::Status, grpc::StatusCode> cases[] = {
        {absl::UnavailableError("no entropy"), grpc::StatusCode::UNAVAILABLE},
        {absl::FailedPreconditionError("wrong version"), grpc::StatusCode::FAILED_PRECONDITION},
        {absl::InvalidArgumentError("bad"), grpc::StatusCode::INVALID_ARGUMENT},
        {absl::NotFoundError("missing"), grpc::StatusCode::NOT_FOUND},
        {absl::InternalError("boom"), grpc::StatusCode::INTERNAL},
    };

    for (const auto& [status, code] : cases) {
        const grpc::Status grpc_status = ToGrpcStatus(status);
        EXPECT_EQ(grpc_status.error_code(), code);
        EXPECT_EQ(grpc_status.error_message(), status.message());

        EXPECT_EQ(FromGrpcStatus(grpc_status), status);
    }
}
