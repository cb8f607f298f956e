#include <catch2/catch_all.hpp>
#include <deepeq/comparison_result.hpp>

using namespace deepeq;

TEST_CASE("format_reason substitutes positional placeholders", "[result]") {
  REQUIRE(format_reason("Expected {0} to be {1}, but found {2}.", {"member Name", "\"Jane\"", "\"John\""})
          == "Expected member Name to be \"Jane\", but found \"John\".");
  REQUIRE(format_reason("{1}{0}{1}", {"a", "b"}) == "bab");
  // unmatched placeholders stay as written
  REQUIRE(format_reason("{0} {5} {x} {}", {"a"}) == "a {5} {x} {}");
  REQUIRE(format_reason("no placeholders", {}) == "no placeholders");
}

TEST_CASE("because clause rendering", "[result]") {
  REQUIRE(BecauseClause{}.render().empty());
  REQUIRE(BecauseClause{"   ", {}}.render().empty());
  REQUIRE(BecauseClause{"we said so", {}}.render() == " because we said so");
  REQUIRE(BecauseClause{"because {0} matters", {"it"}}.render() == " because it matters");
}

TEST_CASE("comparison result collects failures in order", "[result]") {
  ComparisonResult r;
  REQUIRE(r.success());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.first() == nullptr);
  REQUIRE(r.summary().empty());

  ComparisonFailure a;
  a.kind = FailureKind::value_mismatch;
  a.path = "Name";
  a.reason = "first {0}";
  a.reason_args = {"one"};
  ComparisonFailure b;
  b.kind = FailureKind::missing_member;
  b.path = "Age";
  b.reason = "second";
  r.add(a);
  r.add(b);

  REQUIRE_FALSE(r.success());
  REQUIRE_FALSE(static_cast<bool>(r));
  REQUIRE(r.failures().size() == 2);
  REQUIRE(r.first()->path == "Name");
  REQUIRE(r.first()->message() == "first one");
  REQUIRE(r.summary() == "first one\nsecond");
}

TEST_CASE("failure kinds have stable names", "[result]") {
  REQUIRE(to_string(FailureKind::value_mismatch) == "value_mismatch");
  REQUIRE(to_string(FailureKind::null_mismatch) == "null_mismatch");
  REQUIRE(to_string(FailureKind::cyclic_reference) == "cyclic_reference");
  REQUIRE(to_string(FailureKind::depth_exceeded) == "depth_exceeded");
}
