#include <deepeq/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using deepeq::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::precondition_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::resource_exhausted) == 5001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
}

TEST_CASE("error payload defaults to internal", "[errors]") {
  deepeq::core::error e;
  REQUIRE(e.code == deepeq::core::error_code::internal);
  REQUIRE(e.message.empty());
  REQUIRE(e.component.empty());
}
