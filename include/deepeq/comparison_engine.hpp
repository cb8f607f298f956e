#pragma once

/** \file comparison_engine.hpp
 *  \brief Recursive structural comparison of two object graphs under a ComparisonPlan.
 *
 * Per pair of values:
 *  1. same identity (or both null) -> equal, no rules consulted
 *  2. exactly one null             -> null_mismatch
 *  3. first matching assertion rule decides, if any
 *  4. leaves compare by value; composites and sequences recurse (the root
 *     always, nested ones when the plan is recursive), otherwise they compare
 *     by registered equality or identity
 *
 * Mismatches are collected (all of them, in traversal order) into the
 * ComparisonResult. The error channel only carries configuration misuse.
 * Each call owns its own cycle tracker; a plan can be shared across threads.
 */

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "deepeq/comparison_result.hpp"
#include "deepeq/configuration.hpp"
#include "deepeq/error.hpp"
#include "deepeq/type_registry.hpp"

namespace deepeq {

/** \brief Runs comparisons under a plan. The plan must outlive the engine. */
class ComparisonEngine {
public:
    explicit ComparisonEngine(const ComparisonPlan& plan) : plan_(plan) {}
    explicit ComparisonEngine(ComparisonPlan&&) = delete;

    /**
     * \brief Compares subject with expectation.
     *
     * The subject's type must be the plan's subject type or derive from it
     * (precondition_failed otherwise). Reaching an unregistered type yields
     * config_invalid.
     */
    [[nodiscard]] auto compare(ValueRef subject, ValueRef expectation,
                               const BecauseClause& because = {}) const
        -> std::expected<ComparisonResult, core::error>;

private:
    const ComparisonPlan& plan_;
};

/** \brief Handle to a possibly-null object. */
template <class T>
[[nodiscard]] auto value_ref(const T* object) -> ValueRef {
    return ValueRef{object, typeid(T)};
}

template <class T>
    requires (!std::is_pointer_v<T> && !std::is_null_pointer_v<T>)
[[nodiscard]] auto value_ref(const T& object) -> ValueRef {
    return ValueRef{std::addressof(object), typeid(T)};
}

inline auto compare(const ComparisonPlan& plan, ValueRef subject, ValueRef expectation,
                    BecauseClause because = {}) -> std::expected<ComparisonResult, core::error> {
    return ComparisonEngine(plan).compare(subject, expectation, because);
}

/**
 * \brief Compares two objects, or two possibly-null pointers.
 *
 * A literal nullptr subject is typed as the plan's subject type; a literal
 * nullptr expectation takes the subject's type.
 */
template <class S, class E>
auto compare(const ComparisonPlan& plan, const S& subject, const E& expectation,
             BecauseClause because = {}) -> std::expected<ComparisonResult, core::error> {
    ValueRef s;
    if constexpr (std::is_null_pointer_v<S>) {
        s = ValueRef{nullptr, plan.subject_type()};
    } else {
        s = value_ref(subject);
    }
    ValueRef e;
    if constexpr (std::is_null_pointer_v<E>) {
        e = ValueRef{nullptr, s.type};
    } else {
        e = value_ref(expectation);
    }
    return ComparisonEngine(plan).compare(s, e, because);
}

} // namespace deepeq
