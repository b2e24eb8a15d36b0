#include <ctxsync/error.hpp>
#include <ctxsync/token_accountant.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <cstdint>

using ctxsync::test::payloadOfSize;

TEST_CASE("Default accountant charges one token per serialized byte") {
  ctxsync::TokenAccountant accountant;
  auto tokens = accountant.estimate(payloadOfSize(123));
  REQUIRE(tokens.has_value());
  REQUIRE(*tokens == 123);
}

TEST_CASE("Byte ratio rounds up") {
  ctxsync::TokenAccountant accountant(4);
  REQUIRE(accountant.estimateBytes(0) == 0);
  REQUIRE(accountant.estimateBytes(1) == 1);
  REQUIRE(accountant.estimateBytes(4) == 1);
  REQUIRE(accountant.estimateBytes(5) == 2);
  REQUIRE(*accountant.estimate(payloadOfSize(40)) == 10);
}

TEST_CASE("Estimates are deterministic and monotonic") {
  ctxsync::TokenAccountant accountant(3);
  uint64_t previous = 0;
  for (size_t size = 8; size < 300; size += 7) {
    auto first = accountant.estimate(payloadOfSize(size));
    auto second = accountant.estimate(payloadOfSize(size));
    REQUIRE(first.has_value());
    REQUIRE(*first == *second);
    REQUIRE(*first >= previous);
    previous = *first;
  }
}

TEST_CASE("Very large byte ratios stay monotonic") {
  ctxsync::TokenAccountant accountant(UINT64_MAX);
  REQUIRE(accountant.estimateBytes(0) == 0);
  REQUIRE(accountant.estimateBytes(1) == 1);
  REQUIRE(accountant.estimateBytes(2) == 1);
  REQUIRE(accountant.estimateBytes(SIZE_MAX) == 1);

  ctxsync::TokenAccountant half(UINT64_MAX / 2);
  REQUIRE(half.estimateBytes(1) == 1);
  REQUIRE(half.estimateBytes(SIZE_MAX) >= half.estimateBytes(1));
}

TEST_CASE("Custom estimator receives the serialized size") {
  size_t seen = 0;
  ctxsync::TokenAccountant accountant([&seen](size_t bytes) -> uint64_t {
    seen = bytes;
    return bytes / 2;
  });
  REQUIRE(*accountant.estimate(payloadOfSize(64)) == 32);
  REQUIRE(seen == 64);
}

TEST_CASE("Invalid UTF-8 cannot be costed") {
  ctxsync::TokenAccountant accountant;
  auto tokens = accountant.estimate(ctxsync::Payload{{"text", "\xc3\x28"}});
  REQUIRE(!tokens.has_value());
  REQUIRE(tokens.error() == ctxsync::CtxError::ValidationError);
}
