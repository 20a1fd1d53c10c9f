#include <gtest/gtest.h>

#include "errors.hpp"
#include "json_codec.hpp"
#include "test_helpers.hpp"

#include <string>

using hengjing::ProtocolError;
using namespace hengjing::ipc;

TEST(JsonCodec, EncodeRequestMatchesWireSchema) {
    auto request = make_request("r1", "Continue?", std::vector<std::string>{"Yes", "No"}, false);

    EXPECT_EQ(codec::encode_request(request),
              R"({"id":"r1","message":"Continue?","predefined_options":["Yes","No"],"is_markdown":false})");
}

TEST(JsonCodec, EncodeRequestWithoutOptionsWritesNull) {
    auto request = make_request("r2", "Proceed", std::nullopt, true);

    EXPECT_EQ(codec::encode_request(request),
              R"({"id":"r2","message":"Proceed","predefined_options":null,"is_markdown":true})");
}

TEST(JsonCodec, EncodedLinesNeverContainNewlines) {
    auto request = make_request("r3", "line one\nline two", std::vector<std::string>{"a\nb"});

    std::string line = codec::encode_request(request);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(codec::decode_request(line), request);
}

TEST(JsonCodec, DecodeRequestRestoresEveryField) {
    auto request = make_request("req-42", "**Deploy** to 生产?", std::vector<std::string>{"Ship it", "Wait", ""}, true);

    Request decoded = codec::decode_request(codec::encode_request(request));

    EXPECT_EQ(decoded.id, "req-42");
    EXPECT_EQ(decoded.message, "**Deploy** to 生产?");
    ASSERT_TRUE(decoded.predefined_options.has_value());
    EXPECT_EQ(decoded.predefined_options->size(), 3u);
    EXPECT_EQ((*decoded.predefined_options)[2], "");
    EXPECT_TRUE(decoded.is_markdown);
    EXPECT_EQ(decoded, request);
}

TEST(JsonCodec, DecodeRequestAcceptsMissingOptions) {
    Request decoded = codec::decode_request(R"({"id":"a","message":"m","is_markdown":false})");

    EXPECT_FALSE(decoded.predefined_options.has_value());
}

TEST(JsonCodec, DecodePrettyRequestFile) {
    auto request = make_request("pretty", "Pick one", std::vector<std::string>{"x", "y"});

    std::string pretty = codec::encode_request_pretty(request);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    EXPECT_EQ(codec::decode_request(pretty), request);
}

TEST(JsonCodec, DecodeRequestRejectsMalformedJson) {
    EXPECT_THROW(codec::decode_request("{\"id\":"), ProtocolError);
    EXPECT_THROW(codec::decode_request(""), ProtocolError);
    EXPECT_THROW(codec::decode_request("[1,2,3]"), ProtocolError);
}

TEST(JsonCodec, DecodeRequestRejectsSchemaViolations) {
    EXPECT_THROW(codec::decode_request(R"({"message":"m","is_markdown":false})"), ProtocolError);
    EXPECT_THROW(codec::decode_request(R"({"id":7,"message":"m","is_markdown":false})"), ProtocolError);
    EXPECT_THROW(codec::decode_request(R"({"id":"a","message":"m","is_markdown":"no"})"), ProtocolError);
    EXPECT_THROW(codec::decode_request(R"({"id":"a","message":"m","predefined_options":"Yes","is_markdown":false})"),
                 ProtocolError);
    EXPECT_THROW(codec::decode_request(R"({"id":"a","message":"m","predefined_options":[1],"is_markdown":false})"),
                 ProtocolError);
}

TEST(JsonCodec, EncodeSuccessResponseHasNullError) {
    EXPECT_EQ(codec::encode_response(Response::answered("r1", "Yes")),
              R"({"id":"r1","response":"Yes","success":true,"error":null})");
}

TEST(JsonCodec, EncodeFailedResponseHasEmptyText) {
    EXPECT_EQ(codec::encode_response(Response::failed("r1", "response channel closed")),
              R"({"id":"r1","response":"","success":false,"error":"response channel closed"})");
}

TEST(JsonCodec, DecodeResponseReadsErrorField) {
    Response failed = codec::decode_response(R"({"id":"x","response":"","success":false,"error":"gone"})");
    EXPECT_FALSE(failed.success);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(*failed.error, "gone");

    Response answered = codec::decode_response(R"({"id":"x","response":"ok","success":true,"error":null})");
    EXPECT_TRUE(answered.success);
    EXPECT_EQ(answered.response, "ok");
    EXPECT_FALSE(answered.error.has_value());
}

TEST(JsonCodec, DecodeResponseRejectsMissingSuccess) {
    EXPECT_THROW(codec::decode_response(R"({"id":"x","response":"ok"})"), ProtocolError);
    EXPECT_THROW(codec::decode_response("garbage"), ProtocolError);
}

TEST(JsonCodec, DecodeResponseRejectsContradictoryShapes) {
    EXPECT_THROW(codec::decode_response(R"({"id":"x","response":"ok","success":true,"error":"boom"})"),
                 ProtocolError);
    EXPECT_THROW(codec::decode_response(R"({"id":"x","response":"partial","success":false,"error":"boom"})"),
                 ProtocolError);
}

TEST(JsonCodec, DecodeResponseToleratesFailureWithoutErrorText) {
    Response failed = codec::decode_response(R"({"id":"x","response":"","success":false,"error":null})");

    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(failed.error.has_value());
}
