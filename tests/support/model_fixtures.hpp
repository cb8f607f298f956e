#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "deepeq/type_registry.hpp"

namespace model_fixtures {

using deepeq::date_time;

struct Address {
    std::string street;
    std::string city;
};

struct Customer {
    std::string name;
    date_time created{};
    Address address;
    std::optional<std::string> nickname;
    int age{0};
};

// Same shape as Customer minus Age; used as a different-typed expectation.
struct CustomerDto {
    std::string name;
    date_time created{};
    Address address;
    std::optional<std::string> nickname;
};

// Singly linked node; Next may point back up the chain.
struct Node {
    std::string name;
    Node* next{nullptr};
};

// Both ends may share one Address object.
struct Shipment {
    std::shared_ptr<Address> from;
    std::shared_ptr<Address> to;
};

struct Animal {
    virtual ~Animal() = default;
    std::string name;
};

struct Dog : Animal {
    int barks{0};
};

struct Kennel {
    std::shared_ptr<Animal> resident;
};

struct Money {
    long long cents{0};
    std::string currency;
    bool operator==(const Money&) const = default;
};

struct Order {
    int id{0};
    Money total;
    std::vector<std::string> tags;
};

struct Account {
    std::string owner;
    std::vector<Order> orders;
    std::vector<std::vector<int>> matrix;
};

// Exposes its state through const getters instead of public fields.
class Badge {
public:
    Badge(std::string holder, int level) : holder_(std::move(holder)), level_(level) {}
    [[nodiscard]] const std::string& holder() const { return holder_; }
    [[nodiscard]] const int& level() const { return level_; }

private:
    std::string holder_;
    int level_;
};

// Registers every fixture type under its display name.
std::shared_ptr<const deepeq::TypeRegistry> make_registry();

// Customer "Jane" created 2024-01-02T03:04:05Z living at "1 Main St", "Springfield", age 42.
Customer make_customer();

CustomerDto to_dto(const Customer& c);

Account make_account();

date_time make_date(int year, unsigned month, unsigned day, int hour = 0, int minute = 0, int second = 0);

} // namespace model_fixtures
