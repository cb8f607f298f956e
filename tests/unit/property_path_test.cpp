#include <catch2/catch_all.hpp>
#include <deepeq/property_path.hpp>

using deepeq::PropertyPath;

TEST_CASE("property path renders members and indices", "[path]") {
  PropertyPath root;
  REQUIRE(root.empty());
  REQUIRE(root.str().empty());
  REQUIRE(root.describe() == "subject");

  auto p = root.member("Orders").index(2).member("Id");
  REQUIRE(p.size() == 3);
  REQUIRE(p.str() == "Orders[2].Id");
  REQUIRE(p.member_path() == "Orders.Id");
  REQUIRE(p.describe() == "member Orders[2].Id");
  // extending never mutates the parent
  REQUIRE(root.empty());
}

TEST_CASE("property path parse", "[path]") {
  auto p = PropertyPath::parse("Address.Street");
  REQUIRE(p.has_value());
  REQUIRE(p->size() == 2);
  REQUIRE(p->segments()[0].name == "Address");
  REQUIRE(p->segments()[1].name == "Street");

  auto indexed = PropertyPath::parse("Orders[1].Id");
  REQUIRE(indexed.has_value());
  REQUIRE(indexed->str() == "Orders.Id");

  for (const char* bad : {"", ".", "Address.", ".Street", "A..B", "Orders[1.Id"}) {
    INFO(bad);
    auto r = PropertyPath::parse(bad);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == deepeq::core::error_code::invalid_argument);
    REQUIRE(r.error().component == "deepeq.path");
  }
}
