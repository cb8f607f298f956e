/**
 * Structural comparison example using deepeq
 *
 * This example demonstrates:
 * - Registering types and their members
 * - Building a plan with exclusions and a numeric tolerance
 * - Reading every failing path from the result
 */

#include <deepeq/deepeq.hpp>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

struct Address {
    std::string street;
    std::string zip;
};

struct Line {
    std::string sku;
    double price{0.0};
};

struct Invoice {
    std::string customer;
    deepeq::date_time issued{};
    Address billing;
    std::vector<Line> lines;
};

int main() {
    using namespace deepeq;

    auto registry = std::make_shared<TypeRegistry>();
    registry->add<Address>("Address")
        .member("Street", &Address::street)
        .member("Zip", &Address::zip);
    registry->add<Line>("Line")
        .member("Sku", &Line::sku)
        .member("Price", &Line::price);
    registry->add<Invoice>("Invoice")
        .member("Customer", &Invoice::customer)
        .member("Issued", &Invoice::issued)
        .member("Billing", &Invoice::billing)
        .member("Lines", &Invoice::lines);

    const auto now = std::chrono::system_clock::now();
    Invoice expected{"ACME", now, {"1 Main St", "12345"}, {{"A-1", 9.99}, {"B-2", 5.00}}};
    Invoice actual{"ACME", now, {"1 Main Street", "12345"}, {{"A-1", 9.990001}, {"B-3", 5.00}}};

    // Street spelling differs between systems; prices are float-rounded.
    auto plan = Configuration<Invoice>::defaults(registry)
                    .exclude("Billing.Street")
                    .override_assertion_for<double>([](const AssertionContext<double>& ctx) {
                        return std::fabs(ctx.subject - ctx.expectation) < 1e-4;
                    })
                    .build();
    if (!plan) {
        std::cerr << "Failed to build plan: " << plan.error().message << std::endl;
        return 1;
    }

    auto result = compare(*plan, actual, expected, BecauseClause{"the invoice was re-imported", {}});
    if (!result) {
        std::cerr << "Comparison error: " << result.error().message << std::endl;
        return 1;
    }

    if (result->success()) {
        std::cout << "Invoices are equivalent" << std::endl;
        return 0;
    }
    std::cout << result->failures().size() << " difference(s):" << std::endl;
    for (const auto& f : result->failures()) {
        std::cout << "  [" << to_string(f.kind) << "] " << f.message() << std::endl;
    }
    return 0;
}
