#include <catch2/catch_all.hpp>
#include <deepeq/type_registry.hpp>

#include "tests/support/model_fixtures.hpp"

using namespace deepeq;
using namespace model_fixtures;

namespace {
std::vector<std::string> names(const std::vector<MemberDescriptor>& members) {
  std::vector<std::string> out;
  for (const auto& m : members) out.push_back(m.name());
  return out;
}
}

TEST_CASE("built-in leaves are registered", "[registry]") {
  TypeRegistry r;
  for (auto t : {std::type_index(typeid(int)), std::type_index(typeid(double)), std::type_index(typeid(bool)),
                 std::type_index(typeid(std::string)), std::type_index(typeid(date_time))}) {
    REQUIRE(r.contains(t));
    REQUIRE(r.find(t)->kind == TypeKind::leaf);
    REQUIRE(r.find(t)->equals != nullptr);
  }
  REQUIRE(r.type_name(typeid(std::string)) == "string");
  REQUIRE_FALSE(r.contains(typeid(Customer)));
}

TEST_CASE("leaf rendering", "[registry]") {
  TypeRegistry r;
  int i = 42;
  bool b = true;
  std::string s = "a\"b";
  char c = 'x';
  date_time d = make_date(2024, 1, 2, 3, 4, 5);
  REQUIRE(r.render(ValueRef{&i, typeid(int)}) == "42");
  REQUIRE(r.render(ValueRef{&b, typeid(bool)}) == "true");
  REQUIRE(r.render(ValueRef{&s, typeid(std::string)}) == "\"a\\\"b\"");
  REQUIRE(r.render(ValueRef{&c, typeid(char)}) == "'x'");
  REQUIRE(r.render(ValueRef{&d, typeid(date_time)}) == "2024-01-02T03:04:05Z");
  REQUIRE(r.render(ValueRef{nullptr, typeid(int)}) == "<null>");
}

TEST_CASE("members are listed in registration order", "[registry]") {
  auto r = make_registry();
  auto members = r->members_of(typeid(Customer));
  REQUIRE(members.has_value());
  REQUIRE(names(*members) == std::vector<std::string>{"Name", "Created", "Address", "Nickname", "Age"});
  REQUIRE((*members)[2].declared_type() == std::type_index(typeid(Address)));
  // optional fields declare their value type
  REQUIRE((*members)[3].declared_type() == std::type_index(typeid(std::string)));
}

TEST_CASE("inherited members come first and keep their owner", "[registry]") {
  auto r = make_registry();
  auto members = r->members_of(typeid(Dog));
  REQUIRE(members.has_value());
  REQUIRE(names(*members) == std::vector<std::string>{"Name", "Barks"});
  REQUIRE((*members)[0].owner_type() == std::type_index(typeid(Animal)));

  REQUIRE(r->is_same_or_derived(typeid(Dog), typeid(Animal)));
  REQUIRE_FALSE(r->is_same_or_derived(typeid(Animal), typeid(Dog)));
  auto derived = r->derived_types(typeid(Animal));
  REQUIRE(derived == std::vector<std::type_index>{typeid(Dog)});
}

TEST_CASE("members_of rejects unregistered types", "[registry]") {
  TypeRegistry r;
  auto members = r.members_of(typeid(Customer));
  REQUIRE_FALSE(members.has_value());
  REQUIRE(members.error().code == core::error_code::config_invalid);
  REQUIRE(members.error().component == "deepeq.registry");
}

TEST_CASE("read_member reads fields, pointers and properties", "[registry]") {
  auto r = make_registry();
  Dog dog;
  dog.name = "Rex";
  dog.barks = 3;
  auto members = r->members_of(typeid(Dog));
  REQUIRE(members.has_value());
  auto name = r->read_member(ValueRef{&dog, typeid(Dog)}, (*members)[0]);
  REQUIRE(name.has_value());
  REQUIRE(*static_cast<const std::string*>(name->address) == "Rex");

  Node tail{"tail", nullptr};
  Node head{"head", &tail};
  auto node_members = r->members_of(typeid(Node));
  REQUIRE(node_members.has_value());
  auto next = r->read_member(ValueRef{&head, typeid(Node)}, (*node_members)[1]);
  REQUIRE(next.has_value());
  REQUIRE(next->address == &tail);
  auto end = r->read_member(ValueRef{&tail, typeid(Node)}, (*node_members)[1]);
  REQUIRE(end.has_value());
  REQUIRE(end->is_null());
  REQUIRE(end->type == std::type_index(typeid(Node)));

  Badge badge("Jane", 7);
  auto badge_members = r->members_of(typeid(Badge));
  REQUIRE(badge_members.has_value());
  auto level = r->read_member(ValueRef{&badge, typeid(Badge)}, (*badge_members)[1]);
  REQUIRE(level.has_value());
  REQUIRE(*static_cast<const int*>(level->address) == 7);

  auto from_null = r->read_member(ValueRef{nullptr, typeid(Node)}, (*node_members)[0]);
  REQUIRE_FALSE(from_null.has_value());
  REQUIRE(from_null.error().code == core::error_code::precondition_failed);

  Address address;
  auto unrelated = r->read_member(ValueRef{&address, typeid(Address)}, (*node_members)[0]);
  REQUIRE_FALSE(unrelated.has_value());
  REQUIRE(unrelated.error().code == core::error_code::config_invalid);
}

TEST_CASE("runtime type resolution follows registered derived types", "[registry]") {
  auto r = make_registry();
  Dog dog;
  const Animal& as_animal = dog;
  auto resolved = r->resolve_runtime(ValueRef{&as_animal, typeid(Animal)});
  REQUIRE(resolved.type == std::type_index(typeid(Dog)));
  REQUIRE(resolved.address == static_cast<const void*>(&dog));

  Animal plain;
  auto same = r->resolve_runtime(ValueRef{&plain, typeid(Animal)});
  REQUIRE(same.type == std::type_index(typeid(Animal)));
}

TEST_CASE("vector members register sequence types", "[registry]") {
  auto r = make_registry();
  const TypeDesc* orders = r->find<std::vector<Order>>();
  REQUIRE(orders != nullptr);
  REQUIRE(orders->kind == TypeKind::sequence);
  REQUIRE(orders->element_type == std::type_index(typeid(Order)));
  REQUIRE(r->type_name(typeid(std::vector<Order>)) == "Order[]");
  REQUIRE(r->contains(typeid(std::vector<int>)));
  REQUIRE(r->find<std::vector<std::vector<int>>>()->equals != nullptr);

  Account a = make_account();
  REQUIRE(r->render(ValueRef{&a.orders, typeid(std::vector<Order>)}) == "Order[] with 2 item(s)");
  REQUIRE(r->render(ValueRef{&a, typeid(Account)}) == "<Account>");
}
