#pragma once

/** \file assertion_rules.hpp
 *  \brief Per-type (or per-predicate) overrides of the default comparison.
 *
 * Rules are kept most-recently-registered first; the first rule whose
 * predicate accepts a member decides that member's comparison, and no
 * structural recursion happens for it.
 */

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "deepeq/comparison_result.hpp"
#include "deepeq/error.hpp"
#include "deepeq/property_path.hpp"
#include "deepeq/type_registry.hpp"

namespace deepeq {

/** \brief Values handed to an assertion action, both non-null and viewed as T. */
template <class T>
struct AssertionContext {
    const T& subject;
    const T& expectation;
    const PropertyPath& path;
    const BecauseClause& because;
};

/** \brief Returns true when subject and expectation are considered equal. */
template <class T>
using AssertionAction = std::function<bool(const AssertionContext<T>&)>;

using MemberPredicate = std::function<bool(const MemberDescriptor&)>;

class AssertionRule {
public:
    virtual ~AssertionRule() = default;

    [[nodiscard]] virtual auto applies_to(const MemberDescriptor& member) const -> bool = 0;

    /**
     * \brief Runs the comparison for a non-null pair.
     *
     * Returns config_invalid when the values cannot be viewed as the rule's type.
     */
    [[nodiscard]] virtual auto assert_equality(const TypeRegistry& registry,
                                               ValueRef subject, ValueRef expectation,
                                               const PropertyPath& path,
                                               const BecauseClause& because) const
        -> std::expected<bool, core::error> = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

template <class T>
class TypedAssertionRule final : public AssertionRule {
public:
    TypedAssertionRule(MemberPredicate predicate, AssertionAction<T> action, std::string description)
        : predicate_(std::move(predicate))
        , action_(std::move(action))
        , description_(std::move(description)) {}

    [[nodiscard]] auto applies_to(const MemberDescriptor& member) const -> bool override {
        return predicate_(member);
    }

    [[nodiscard]] auto assert_equality(const TypeRegistry& registry,
                                       ValueRef subject, ValueRef expectation,
                                       const PropertyPath& path,
                                       const BecauseClause& because) const
        -> std::expected<bool, core::error> override {
        const T* s = view(registry, subject);
        const T* e = view(registry, expectation);
        if (!s || !e) {
            const ValueRef& bad = s ? expectation : subject;
            return std::unexpected(core::error{core::error_code::config_invalid,
                "assertion rule '" + description_ + "' matched " + path.describe() + " of type " +
                registry.type_name(bad.type) + " which cannot be viewed as " +
                registry.type_name(typeid(T)), "deepeq.assertion"});
        }
        return action_(AssertionContext<T>{*s, *e, path, because});
    }

    [[nodiscard]] auto describe() const -> std::string override { return description_; }

private:
    static auto view(const TypeRegistry& registry, ValueRef value) -> const T* {
        if (value.type == std::type_index(typeid(T))) return static_cast<const T*>(value.address);
        ValueRef runtime = registry.resolve_runtime(value);
        return static_cast<const T*>(registry.upcast(runtime.address, runtime.type, typeid(T)));
    }

    MemberPredicate predicate_;
    AssertionAction<T> action_;
    std::string description_;
};

/** \brief Action comparing with T::operator==. */
template <class T>
auto equality_action() -> AssertionAction<T> {
    return [](const AssertionContext<T>& ctx) { return ctx.subject == ctx.expectation; };
}

/** \brief First rule (in list order) whose predicate accepts member, or nullptr. */
[[nodiscard]] auto resolve_assertion(const std::vector<std::shared_ptr<const AssertionRule>>& rules,
                                     const MemberDescriptor& member) -> const AssertionRule*;

} // namespace deepeq
