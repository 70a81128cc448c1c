#include <cstdint>
#include <string_view>

#include <doctest/doctest.h>

#include "splitjoin/message/source.hpp"
#include "splitjoin/splitjoin.h"

TEST_CASE("message_fixed_source_returns_default_message") {
  const splitjoin::message::source source = splitjoin::message::fixed_source();
  REQUIRE(static_cast<bool>(source));

  std::string_view text = {};
  int32_t err = SPLITJOIN_ERR_BACKEND;
  CHECK(source(&text, &err));
  CHECK(err == SPLITJOIN_OK);
  CHECK(text == "Hello      World!");
  CHECK(text == splitjoin::message::k_default_message);
}

TEST_CASE("message_fixed_source_rejects_missing_output") {
  const splitjoin::message::source source = splitjoin::message::fixed_source();
  int32_t err = SPLITJOIN_OK;
  CHECK_FALSE(source(nullptr, &err));
  CHECK(err == SPLITJOIN_ERR_INVALID_ARGUMENT);
}

TEST_CASE("message_empty_source_is_falsy_and_fails") {
  const splitjoin::message::source source = {};
  std::string_view text = "unchanged";
  int32_t err = SPLITJOIN_OK;
  CHECK_FALSE(static_cast<bool>(source));
  CHECK_FALSE(source(&text, &err));
  CHECK(text == "unchanged");
}
