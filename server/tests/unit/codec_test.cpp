#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "addsvc/codec.hpp"
#include "addsvc/errors.hpp"

namespace {

addsvc::HttpRequest RequestWithBody(const std::string& body) {
  addsvc::HttpRequest req{boost::beast::http::verb::post, "/api/add/sum", 11};
  req.body() = body;
  req.prepare_payload();
  return req;
}

addsvc::TransportError::Kind DecodeFailureKind(const std::string& body) {
  try {
    (void)addsvc::DecodeHttpSumRequest(addsvc::RequestContext{}, RequestWithBody(body));
  } catch (const addsvc::TransportError& ex) {
    return ex.GetKind();
  }
  ADD_FAILURE() << "expected decode failure for body: " << body;
  return addsvc::TransportError::Kind::kTokenContextMissing;
}

struct CreatedResponse {
  int StatusCode() const { return 201; }
  std::vector<std::pair<std::string, std::string>> Headers() const {
    return {{"X-Request-Id", "abc"}, {"X-Request-Id", "def"}};
  }
  nlohmann::json Response() const { return {{"created", true}}; }
};

struct EmptyResponse {
  int StatusCode() const { return 204; }
  nlohmann::json Response() const { return nullptr; }
};

TEST(CodecTest, DecodesSumRequest) {
  auto req = addsvc::DecodeHttpSumRequest(addsvc::RequestContext{}, RequestWithBody(R"({"a":2,"b":3})"));
  EXPECT_EQ(req.a, 2);
  EXPECT_EQ(req.b, 3);
}

TEST(CodecTest, DecodesConcatRequest) {
  auto req = addsvc::DecodeHttpConcatRequest(addsvc::RequestContext{}, RequestWithBody(R"({"a":"foo","b":"bar"})"));
  EXPECT_EQ(req.a, "foo");
  EXPECT_EQ(req.b, "bar");
}

TEST(CodecTest, MissingAndNullFieldsKeepZeroValues) {
  auto req = addsvc::DecodeHttpSumRequest(addsvc::RequestContext{}, RequestWithBody(R"({"a":7,"b":null,"c":1})"));
  EXPECT_EQ(req.a, 7);
  EXPECT_EQ(req.b, 0);

  auto concat = addsvc::DecodeHttpConcatRequest(addsvc::RequestContext{}, RequestWithBody("{}"));
  EXPECT_TRUE(concat.a.empty());
  EXPECT_TRUE(concat.b.empty());
}

TEST(CodecTest, MalformedBodiesAreSyntaxErrors) {
  EXPECT_EQ(DecodeFailureKind("not-json"), addsvc::TransportError::Kind::kJsonSyntax);
  EXPECT_EQ(DecodeFailureKind("{\"a\" 1}"), addsvc::TransportError::Kind::kJsonSyntax);
}

TEST(CodecTest, DataAfterFirstValueIsIgnored) {
  auto req = addsvc::DecodeHttpSumRequest(addsvc::RequestContext{}, RequestWithBody(R"({"a":2,"b":3} x)"));
  EXPECT_EQ(req.a, 2);
  EXPECT_EQ(req.b, 3);
  EXPECT_EQ(DecodeFailureKind("{\"a\":2"), addsvc::TransportError::Kind::kUnexpectedEof);
}

TEST(CodecTest, EmptyBodyIsEndOfStream) {
  EXPECT_EQ(DecodeFailureKind(""), addsvc::TransportError::Kind::kUnexpectedEof);
  EXPECT_EQ(DecodeFailureKind("  \n"), addsvc::TransportError::Kind::kUnexpectedEof);
}

TEST(CodecTest, WrongTypesAreTypeMismatches) {
  EXPECT_EQ(DecodeFailureKind(R"({"a":"2","b":3})"), addsvc::TransportError::Kind::kJsonType);
  EXPECT_EQ(DecodeFailureKind(R"({"a":2.5,"b":3})"), addsvc::TransportError::Kind::kJsonType);
  EXPECT_EQ(DecodeFailureKind(R"({"a":18446744073709551615})"), addsvc::TransportError::Kind::kJsonType);
  EXPECT_EQ(DecodeFailureKind("[1,2]"), addsvc::TransportError::Kind::kJsonType);

  try {
    (void)addsvc::DecodeHttpConcatRequest(addsvc::RequestContext{}, RequestWithBody(R"({"a":1})"));
    FAIL() << "expected type mismatch";
  } catch (const addsvc::TransportError& ex) {
    EXPECT_EQ(ex.GetKind(), addsvc::TransportError::Kind::kJsonType);
    EXPECT_NE(std::string(ex.what()).find("ConcatRequest.a"), std::string::npos);
  }
}

TEST(CodecTest, EncodesPlainResponseAsJson) {
  addsvc::HttpResponse res;
  addsvc::EncodeJsonResponse(addsvc::RequestContext{}, res, addsvc::SumResponse{5});
  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_EQ(std::string(res[boost::beast::http::field::content_type]), "application/json; charset=utf-8");
  EXPECT_EQ(nlohmann::json::parse(res.body()), (nlohmann::json{{"res", 5}}));
}

TEST(CodecTest, EncoderHonoursResponseCapabilities) {
  addsvc::HttpResponse res;
  addsvc::EncodeJsonResponse(addsvc::RequestContext{}, res, CreatedResponse{});
  EXPECT_EQ(res.result_int(), 201u);
  EXPECT_EQ(res.count("X-Request-Id"), 2u);
  EXPECT_EQ(nlohmann::json::parse(res.body()), (nlohmann::json{{"created", true}}));
}

TEST(CodecTest, NoContentWritesNoBody) {
  addsvc::HttpResponse res;
  res.body() = "stale";
  addsvc::EncodeJsonResponse(addsvc::RequestContext{}, res, EmptyResponse{});
  EXPECT_EQ(res.result(), boost::beast::http::status::no_content);
  EXPECT_TRUE(res.body().empty());
}

TEST(CodecTest, ClientRequestEncoding) {
  addsvc::HttpRequest req{boost::beast::http::verb::post, "/api/add/concat", 11};
  addsvc::EncodeJsonRequest(addsvc::RequestContext{}, req, addsvc::ConcatRequest{"foo", "bar"});
  EXPECT_EQ(std::string(req[boost::beast::http::field::content_type]), "application/json; charset=utf-8");
  EXPECT_EQ(nlohmann::json::parse(req.body()), (nlohmann::json{{"a", "foo"}, {"b", "bar"}}));
  EXPECT_EQ(std::string(req[boost::beast::http::field::content_length]), std::to_string(req.body().size()));
}

TEST(CodecTest, ServerEncodingRoundTripsThroughClientDecoding) {
  addsvc::HttpResponse sum_res;
  addsvc::EncodeJsonResponse(addsvc::RequestContext{}, sum_res, addsvc::SumResponse{-42});
  EXPECT_EQ(addsvc::DecodeHttpSumResponse(addsvc::RequestContext{}, sum_res), addsvc::SumResponse{-42});

  addsvc::HttpResponse concat_res;
  addsvc::EncodeJsonResponse(addsvc::RequestContext{}, concat_res, addsvc::ConcatResponse{"foobar"});
  EXPECT_EQ(addsvc::DecodeHttpConcatResponse(addsvc::RequestContext{}, concat_res), addsvc::ConcatResponse{"foobar"});
}

TEST(CodecTest, ClientDecodesErrorEnvelopeOnFailureStatus) {
  addsvc::HttpResponse res{boost::beast::http::status::bad_request, 11};
  res.set(boost::beast::http::field::content_type, "application/json");
  res.body() = R"({"error":{"code":400,"message":"bad a","errors":[{"field":"a","message":"bad a"}]}})";
  try {
    (void)addsvc::DecodeHttpSumResponse(addsvc::RequestContext{}, res);
    FAIL() << "expected remote error";
  } catch (const addsvc::RemoteError& ex) {
    EXPECT_EQ(ex.Code(), 400);
    EXPECT_EQ(ex.Msg(), "bad a");
    ASSERT_EQ(ex.Errors().size(), 1u);
    EXPECT_EQ(*ex.Errors()[0].field, "a");
  }
}

TEST(CodecTest, ClientRejectsNonJsonErrorBodies) {
  addsvc::HttpResponse res{boost::beast::http::status::bad_gateway, 11};
  res.set(boost::beast::http::field::content_type, "text/html");
  res.body() = "<html>upstream down</html>";
  try {
    (void)addsvc::DecodeHttpConcatResponse(addsvc::RequestContext{}, res);
    FAIL() << "expected protocol error";
  } catch (const addsvc::RemoteError&) {
    FAIL() << "non-JSON body must not be parsed";
  } catch (const std::runtime_error& ex) {
    EXPECT_NE(std::string(ex.what()).find("text/html"), std::string::npos);
  }
}

TEST(CodecTest, SuccessBodyThatIsNotJsonIsDecodeError) {
  addsvc::HttpResponse res{boost::beast::http::status::ok, 11};
  res.body() = "definitely not json";
  EXPECT_THROW((void)addsvc::DecodeHttpSumResponse(addsvc::RequestContext{}, res), addsvc::TransportError);
}

}  // namespace
