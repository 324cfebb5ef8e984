/**
 * @file test_codec.cpp
 * @brief Unit tests for the JSON request/response codec.
 */

#include "protocol/codec.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

using namespace exec_sandbox;
using namespace std::chrono_literals;

// ── Requests ─────────────────────────────────

TEST(DecodeRequestTest, FullDocument) {
    auto request = decode_request(R"json({"code":"print(1)","input":"5\n","time_limit_ms":2500})json");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->code, "print(1)");
    EXPECT_EQ(request->input, "5\n");
    EXPECT_EQ(request->time_limit, 2500ms);
}

TEST(DecodeRequestTest, DefaultsApply) {
    auto request = decode_request(R"({"code":"x"})");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->input, "");
    EXPECT_EQ(request->time_limit, 10000ms);
}

TEST(DecodeRequestTest, ConfiguredDefaultLimit) {
    auto request = decode_request(R"({"code":"x"})", 3000ms);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->time_limit, 3000ms);
}

TEST(DecodeRequestTest, MissingOrNullCodeIsEmpty) {
    auto missing = decode_request(R"({"input":"1"})");
    ASSERT_TRUE(missing.has_value());
    EXPECT_TRUE(missing->code.empty());

    auto null_code = decode_request(R"({"code":null})");
    ASSERT_TRUE(null_code.has_value());
    EXPECT_TRUE(null_code->code.empty());
}

TEST(DecodeRequestTest, FractionalAndNegativeLimitsAreAccepted) {
    auto fractional = decode_request(R"({"code":"x","time_limit_ms":1500.9})");
    ASSERT_TRUE(fractional.has_value());
    EXPECT_EQ(fractional->time_limit, 1500ms);

    // Clamping to the supervisor's floor happens later.
    auto negative = decode_request(R"({"code":"x","time_limit_ms":-5})");
    ASSERT_TRUE(negative.has_value());
    EXPECT_EQ(negative->time_limit, -5ms);
}

TEST(DecodeRequestTest, HugeLimitsSaturateInsteadOfWrapping) {
    const Milliseconds max{std::numeric_limits<int64_t>::max()};
    for (const char* doc : {R"({"code":"x","time_limit_ms":18446744073709551615})",
                            R"({"code":"x","time_limit_ms":9223372036854775808})",
                            R"({"code":"x","time_limit_ms":9223372036854775807})"}) {
        auto request = decode_request(doc);
        ASSERT_TRUE(request.has_value()) << doc;
        EXPECT_EQ(request->time_limit, max) << doc;
    }

    auto huge_float = decode_request(R"({"code":"x","time_limit_ms":1e30})");
    ASSERT_TRUE(huge_float.has_value());
    EXPECT_GT(huge_float->time_limit, 0ms);
}

TEST(DecodeRequestTest, WrongTypesAreParseErrors) {
    for (const char* doc : {R"({"code":42})",
                            R"({"code":"x","input":["a"]})",
                            R"({"code":"x","time_limit_ms":"fast"})",
                            R"({"code":"x","time_limit_ms":true})"}) {
        auto request = decode_request(doc);
        ASSERT_FALSE(request.has_value()) << doc;
        EXPECT_EQ(request.error().kind, ErrorKind::Parse);
    }
}

TEST(DecodeRequestTest, NonObjectDocumentRejected) {
    EXPECT_FALSE(decode_request(R"(["code"])").has_value());
    EXPECT_FALSE(decode_request(R"json("print(1)")json").has_value());
}

TEST(DecodeRequestTest, MalformedJsonRejected) {
    auto request = decode_request(R"json({"code": "print(1)")json");
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error().kind, ErrorKind::Parse);
}

TEST(DecodeRequestTest, UnknownFieldsIgnored) {
    auto request = decode_request(R"({"code":"x","language":"python","user":7})");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->code, "x");
}

TEST(EncodeRequestTest, ProducesDecodableDocument) {
    ExecutionRequest request{.code = "print(input())", .input = "hi", .time_limit = 750ms};
    auto decoded = decode_request(encode_request(request));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->code, request.code);
    EXPECT_EQ(decoded->input, request.input);
    EXPECT_EQ(decoded->time_limit, 750ms);
}

// ── Responses ────────────────────────────────

TEST(EncodeResponseTest, WireFieldsOnly) {
    ExecutionOutcome outcome;
    outcome.status = OutcomeStatus::RuntimeError;
    outcome.output = "Traceback\n";
    outcome.elapsed = 42ms;
    outcome.memory_kb = 9000;
    outcome.exit_code = 1;
    outcome.time_limit_clamped = true;

    auto doc = json::parse(encode_response(outcome));
    EXPECT_EQ(doc.size(), 4u);
    EXPECT_EQ(doc["status"], "runtime_error");
    EXPECT_EQ(doc["output"], "Traceback\n");
    EXPECT_EQ(doc["execution_time_ms"], 42);
    EXPECT_EQ(doc["memory_used_kb"], 9000);
}

TEST(EncodeResponseTest, SetupErrorUsesCompilationErrorName) {
    auto doc = json::parse(encode_response(ExecutionOutcome::setup_error("No code provided")));
    EXPECT_EQ(doc["status"], "compilation_error");
    EXPECT_EQ(doc["output"], "No code provided");
    EXPECT_EQ(doc["execution_time_ms"], 0);
    EXPECT_EQ(doc["memory_used_kb"], 0);
}

TEST(EncodeResponseTest, InvalidUtf8IsReplaced) {
    ExecutionOutcome outcome;
    outcome.status = OutcomeStatus::Success;
    outcome.output = std::string("ok\xff\xfe", 4);

    std::string encoded;
    ASSERT_NO_THROW(encoded = encode_response(outcome));
    auto doc = json::parse(encoded);
    EXPECT_EQ(doc["output"], "ok\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(DecodeResponseTest, ReadsEncodedOutcome) {
    ExecutionOutcome outcome;
    outcome.status = OutcomeStatus::TimeLimitExceeded;
    outcome.output = "Execution timed out after 1.0 seconds";
    outcome.elapsed = 1003ms;
    outcome.memory_kb = 77;

    auto decoded = decode_response(encode_response(outcome));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->status, OutcomeStatus::TimeLimitExceeded);
    EXPECT_EQ(decoded->output, outcome.output);
    EXPECT_EQ(decoded->elapsed, 1003ms);
    EXPECT_EQ(decoded->memory_kb, 77u);
}

TEST(DecodeResponseTest, RejectsUnknownStatus) {
    EXPECT_FALSE(decode_response(R"({"status":"accepted","output":""})").has_value());
    EXPECT_FALSE(decode_response(R"({"output":""})").has_value());
    EXPECT_FALSE(decode_response("not json").has_value());
}
