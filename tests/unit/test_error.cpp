/**
 * @file test_error.cpp
 * @brief Unit tests for the restful error handling system
 *
 * Tests coverage for:
 * - ErrorCode: categories and names
 * - SourceLocation: Source tracking
 * - Error: context, cause chains, summary and to_string
 * - Result<T>: Result type for both void and value types
 */

#include <gtest/gtest.h>
#include <restful/common/error.hpp>

#include <string>
#include <thread>
#include <atomic>
#include <vector>

using namespace restful::common;

// ============================================================================
// ErrorCode Tests
// ============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, SuccessCode) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::UNKNOWN_ERROR));
}

TEST_F(ErrorCodeTest, CategoryExtraction) {
    EXPECT_EQ(get_category(ErrorCode::OPERATION_CANCELLED), ErrorCategory::GENERAL);
    EXPECT_EQ(get_category(ErrorCode::CONNECTION_REFUSED), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::DNS_RESOLUTION_FAILED), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::REDIRECT_BLOCKED), ErrorCategory::PROTOCOL);
    EXPECT_EQ(get_category(ErrorCode::CIRCUIT_OPEN), ErrorCategory::RESOURCE);
    EXPECT_EQ(get_category(ErrorCode::CONFIG_PARSE_ERROR), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::CERTIFICATE_ERROR), ErrorCategory::SECURITY);
    EXPECT_EQ(get_category(ErrorCode::DECODING_ERROR), ErrorCategory::SERIALIZATION);
    EXPECT_EQ(get_category(ErrorCode::VALIDATION_FAILED), ErrorCategory::VALIDATION);
}

TEST_F(ErrorCodeTest, CategoryNames) {
    EXPECT_EQ(category_name(ErrorCategory::GENERAL), "General");
    EXPECT_EQ(category_name(ErrorCategory::IO), "I/O");
    EXPECT_EQ(category_name(ErrorCategory::PROTOCOL), "Protocol");
    EXPECT_EQ(category_name(ErrorCategory::RESOURCE), "Resource");
    EXPECT_EQ(category_name(ErrorCategory::SERIALIZATION), "Serialization");
}

TEST_F(ErrorCodeTest, ErrorNames) {
    EXPECT_EQ(error_name(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(error_name(static_cast<ErrorCode>(0x7777)), "UNKNOWN");
    EXPECT_EQ(error_name(ErrorCode::CIRCUIT_OPEN), "CIRCUIT_OPEN");
    EXPECT_EQ(error_name(ErrorCode::REDIRECT_BLOCKED), "REDIRECT_BLOCKED");
    EXPECT_EQ(error_name(ErrorCode::CONFIG_TYPE_MISMATCH), "CONFIG_TYPE_MISMATCH");
}

// ============================================================================
// SourceLocation Tests
// ============================================================================

class SourceLocationTest : public ::testing::Test {};

TEST_F(SourceLocationTest, DefaultConstruction) {
    SourceLocation loc;
    EXPECT_FALSE(loc.is_valid());
    EXPECT_EQ(loc.line, 0u);
}

TEST_F(SourceLocationTest, ManualConstruction) {
    SourceLocation loc("pool.cpp", "acquire", 42, 10);
    EXPECT_TRUE(loc.is_valid());
    EXPECT_STREQ(loc.file, "pool.cpp");
    EXPECT_STREQ(loc.function, "acquire");
    EXPECT_EQ(loc.line, 42u);
    EXPECT_EQ(loc.column, 10u);
}

// ============================================================================
// Error Tests
// ============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultConstruction) {
    Error err;
    EXPECT_TRUE(err.is_success());
    EXPECT_FALSE(err.is_error());
    EXPECT_EQ(err.code(), ErrorCode::SUCCESS);
    EXPECT_TRUE(err.message().empty());
}

TEST_F(ErrorTest, ConstructWithMessage) {
    Error err(ErrorCode::CONNECTION_REFUSED, "connect to api.example.com:443 refused");
    EXPECT_EQ(err.code(), ErrorCode::CONNECTION_REFUSED);
    EXPECT_EQ(err.category(), ErrorCategory::IO);
    EXPECT_EQ(err.message(), "connect to api.example.com:443 refused");
}

TEST_F(ErrorTest, ConstructWithLocation) {
    SourceLocation loc("curl_backend.cpp", "execute", 100);
    Error err(ErrorCode::OPERATION_TIMEOUT, "Timeout was reached", loc);

    EXPECT_EQ(err.message(), "Timeout was reached");
    EXPECT_TRUE(err.location().is_valid());
    EXPECT_STREQ(err.location().file, "curl_backend.cpp");
}

TEST_F(ErrorTest, WithContext) {
    Error err(ErrorCode::REDIRECT_BLOCKED, "redirect attempt avoided");
    err.with_context("location", "https://elsewhere.example.com/")
       .with_context("status", "302");

    std::string str = err.to_string();
    EXPECT_NE(str.find("location: https://elsewhere.example.com/"), std::string::npos);
    EXPECT_NE(str.find("status: 302"), std::string::npos);
}

TEST_F(ErrorTest, WithCause) {
    Error root_cause(ErrorCode::DNS_RESOLUTION_FAILED, "Could not resolve host");
    Error err(ErrorCode::CONNECTION_FAILED, "Could not connect");
    err.with_cause(root_cause);

    ASSERT_NE(err.cause(), nullptr);
    EXPECT_EQ(err.cause()->code(), ErrorCode::DNS_RESOLUTION_FAILED);
    EXPECT_NE(err.to_string().find("Caused by"), std::string::npos);
}

TEST_F(ErrorTest, ToString) {
    Error err(ErrorCode::PROTOCOL_ERROR, "Invalid status line");
    std::string str = err.to_string();

    EXPECT_NE(str.find("[Protocol]"), std::string::npos);
    EXPECT_NE(str.find("PROTOCOL_ERROR"), std::string::npos);
    EXPECT_NE(str.find("0x0200"), std::string::npos);
    EXPECT_NE(str.find("Invalid status line"), std::string::npos);
}

TEST_F(ErrorTest, SummaryIsSingleLine) {
    Error err(ErrorCode::CIRCUIT_OPEN, "breaker 'items' is open");
    err.with_context("retry_in_ms", "1200");
    err.with_cause(Error(ErrorCode::CONNECTION_RESET));

    std::string summary = err.summary();
    EXPECT_EQ(summary.find('\n'), std::string::npos);
    EXPECT_EQ(summary.rfind("CIRCUIT_OPEN: breaker 'items' is open", 0), 0u);
    EXPECT_NE(summary.find("retry_in_ms=1200"), std::string::npos);
    EXPECT_NE(summary.find("(caused by CONNECTION_RESET)"), std::string::npos);
}

TEST_F(ErrorTest, CopyConstruction) {
    Error original(ErrorCode::RESOURCE_EXHAUSTED, "no idle handle");
    original.with_context("pool", "items");
    original.with_cause(Error(ErrorCode::RESOURCE_BUSY));

    Error copy(original);

    EXPECT_EQ(copy.code(), ErrorCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(copy.message(), "no idle handle");
    ASSERT_NE(copy.cause(), nullptr);
    EXPECT_EQ(copy.cause()->code(), ErrorCode::RESOURCE_BUSY);
    EXPECT_NE(copy.cause(), original.cause());
}

TEST_F(ErrorTest, CopyAssignmentReplacesCause) {
    Error target(ErrorCode::CONNECTION_RESET, "reset");
    target.with_cause(Error(ErrorCode::READ_ERROR));

    Error source(ErrorCode::OPERATION_TIMEOUT, "deadline");
    target = source;

    EXPECT_EQ(target.code(), ErrorCode::OPERATION_TIMEOUT);
    EXPECT_EQ(target.cause(), nullptr);
    EXPECT_TRUE(target.context().empty());
}

TEST_F(ErrorTest, CopyAssignment) {
    Error original(ErrorCode::CERTIFICATE_ERROR, "self signed certificate");
    Error copy;
    copy = original;

    EXPECT_EQ(copy.code(), ErrorCode::CERTIFICATE_ERROR);
    EXPECT_EQ(copy.message(), "self signed certificate");
}

// ============================================================================
// Result<void> Tests
// ============================================================================

class ResultVoidTest : public ::testing::Test {};

TEST_F(ResultVoidTest, SuccessHasNoError) {
    Result<void> result;
    EXPECT_TRUE(result);
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
    EXPECT_TRUE(result.message().empty());
}

TEST_F(ResultVoidTest, OkAndErrHelpers) {
    EXPECT_TRUE(ok().is_success());

    auto failed = err(ErrorCode::CONFIG_INVALID, "bad pool section");
    EXPECT_TRUE(failed.is_error());
    EXPECT_EQ(failed.message(), "bad pool section");
}

// ============================================================================
// Result<T> Tests
// ============================================================================

class ResultValueTest : public ::testing::Test {};

TEST_F(ResultValueTest, ConstructWithValue) {
    Result<int> result(42);
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultValueTest, ConstructWithMessage) {
    Result<std::string> result(ErrorCode::DECODING_ERROR, "incorrect header check");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::DECODING_ERROR);
    EXPECT_EQ(result.message(), "incorrect header check");
}

TEST_F(ResultValueTest, ValueOr) {
    Result<int> success(10);
    Result<int> failure(ErrorCode::NOT_FOUND);

    EXPECT_EQ(success.value_or(0), 10);
    EXPECT_EQ(failure.value_or(-1), -1);
}

TEST_F(ResultValueTest, MapSuccessAndError) {
    Result<int> success(21);
    auto doubled = success.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.is_success());
    EXPECT_EQ(doubled.value(), 42);

    Result<int> failure(ErrorCode::INVALID_ARGUMENT);
    auto mapped = failure.map([](int v) { return v * 2; });
    EXPECT_EQ(mapped.code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ResultValueTest, MoveOutValue) {
    Result<std::vector<uint8_t>> result(std::vector<uint8_t>{1, 2, 3});
    auto bytes = std::move(result).value();
    EXPECT_EQ(bytes.size(), 3u);
}

TEST_F(ResultValueTest, CopyPreservesError) {
    Result<int> original(Error(ErrorCode::CIRCUIT_OPEN, "open"));
    Result<int> copy(original);
    EXPECT_EQ(copy.code(), ErrorCode::CIRCUIT_OPEN);
    EXPECT_EQ(copy.message(), "open");
}

namespace {

Result<int> parse_positive(int v) {
    if (v <= 0) {
        return err<int>(ErrorCode::INVALID_ARGUMENT, "not positive");
    }
    return ok(v);
}

Result<int> add_one(int v) {
    int parsed = 0;
    RESTFUL_TRY_ASSIGN(parsed, parse_positive(v));
    return parsed + 1;
}

Result<void> check_all(const std::vector<int>& values) {
    for (int v : values) {
        RESTFUL_TRY(parse_positive(v));
    }
    return ok();
}

}  // namespace

TEST_F(ResultValueTest, TryPropagatesIntoVoidResult) {
    EXPECT_TRUE(check_all({1, 2, 3}).is_success());

    auto failed = check_all({1, 0, 3});
    EXPECT_EQ(failed.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(failed.message(), "not positive");
}

TEST_F(ResultValueTest, ErrorOnSuccessIsEmpty) {
    Result<std::string> result(std::string("body"));
    EXPECT_EQ(result.error().code(), ErrorCode::SUCCESS);
    EXPECT_EQ(std::move(result).value_or("fallback"), "body");
}

TEST_F(ResultValueTest, TryAssignPropagates) {
    EXPECT_EQ(add_one(1).value(), 2);
    EXPECT_EQ(add_one(-1).code(), ErrorCode::INVALID_ARGUMENT);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

class ErrorThreadSafetyTest : public ::testing::Test {};

TEST_F(ErrorThreadSafetyTest, ConcurrentErrorCreation) {
    constexpr int NUM_THREADS = 8;
    constexpr int ITERATIONS  = 1000;

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&mismatches] {
            for (int i = 0; i < ITERATIONS; ++i) {
                Error err(ErrorCode::CONNECTION_RESET, "reset " + std::to_string(i),
                          SourceLocation("t.cpp", "f", 1));
                err.with_context("i", std::to_string(i));
                Error copy(err);
                if (copy.message() != err.message()) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}
