#pragma once

/** \file configuration.hpp
 *  \brief Fluent builder assembling rules and policies into an immutable ComparisonPlan.
 *
 * Usage:
 * ```cpp
 * auto plan = Configuration<Customer>::defaults(registry)
 *                 .exclude("Address.Zip")
 *                 .override_assertion_for<double>(approx)
 *                 .build();
 * if (!plan) { handle(plan.error()); }
 * ```
 *
 * A Configuration is a mutable, single-threaded builder. build() copies its
 * rule lists into a ComparisonPlan, which is never mutated afterwards and can
 * be shared by concurrent comparisons.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "deepeq/error.hpp"
#include "deepeq/rules/assertion_rules.hpp"
#include "deepeq/rules/matching_rules.hpp"
#include "deepeq/rules/selection_rules.hpp"
#include "deepeq/type_registry.hpp"

namespace deepeq {

/** \brief What happens when an object already on the current path is reached again. */
enum class CyclicReferenceHandling {
    throw_exception,   /**< recorded as a cyclic_reference failure */
    ignore             /**< pair treated as equal, no further recursion */
};

/** \brief Depth limit used when neither max_depth() nor DEEPEQ_MAX_DEPTH is given. */
inline constexpr std::uint32_t kDefaultMaxDepth = 64;

/** \brief Largest accepted depth limit; deeper recursion would risk the native stack. */
inline constexpr std::uint32_t kMaxDepthCeiling = 1024;

/** \brief Frozen set of rules and policies driving one or more comparisons. */
class ComparisonPlan {
public:
    [[nodiscard]] auto registry() const noexcept -> const TypeRegistry& { return *registry_; }
    [[nodiscard]] auto subject_type() const noexcept -> std::type_index { return subject_type_; }

    [[nodiscard]] auto selection_rules() const noexcept
        -> const std::vector<std::shared_ptr<const SelectionRule>>& { return selection_rules_; }
    [[nodiscard]] auto matching_rules() const noexcept
        -> const std::vector<std::shared_ptr<const MatchingRule>>& { return matching_rules_; }
    /** \brief Most recently registered first. */
    [[nodiscard]] auto assertion_rules() const noexcept
        -> const std::vector<std::shared_ptr<const AssertionRule>>& { return assertion_rules_; }

    [[nodiscard]] auto recurse() const noexcept -> bool { return recurse_; }
    [[nodiscard]] auto cyclic_reference_handling() const noexcept -> CyclicReferenceHandling {
        return cyclic_reference_handling_;
    }
    [[nodiscard]] auto max_depth() const noexcept -> std::uint32_t { return max_depth_; }
    [[nodiscard]] auto trace() const noexcept -> bool { return trace_; }

private:
    friend class ConfigurationBase;
    ComparisonPlan() = default;

    std::shared_ptr<const TypeRegistry> registry_;
    std::type_index subject_type_{typeid(void)};
    std::vector<std::shared_ptr<const SelectionRule>> selection_rules_;
    std::vector<std::shared_ptr<const MatchingRule>> matching_rules_;
    std::vector<std::shared_ptr<const AssertionRule>> assertion_rules_;
    bool recurse_{false};
    CyclicReferenceHandling cyclic_reference_handling_{CyclicReferenceHandling::throw_exception};
    std::uint32_t max_depth_{kDefaultMaxDepth};
    bool trace_{false};
};

/** \brief Type-independent part of the builder. */
class ConfigurationBase {
public:
    /**
     * \brief Validates and freezes the configuration.
     *
     * Fails with config_invalid when the subject type is not registered, no
     * matching rule is present, an include/exclude path does not resolve, or
     * the depth limit is zero; with resource_exhausted when max_depth() is
     * above kMaxDepthCeiling. A larger DEEPEQ_MAX_DEPTH is clamped.
     */
    [[nodiscard]] auto build() const -> std::expected<ComparisonPlan, core::error>;

    [[nodiscard]] auto selection_rules() const noexcept
        -> const std::vector<std::shared_ptr<const SelectionRule>>& { return selection_rules_; }
    [[nodiscard]] auto matching_rules() const noexcept
        -> const std::vector<std::shared_ptr<const MatchingRule>>& { return matching_rules_; }
    [[nodiscard]] auto assertion_rules() const noexcept
        -> const std::vector<std::shared_ptr<const AssertionRule>>& { return assertion_rules_; }
    [[nodiscard]] auto recurse() const noexcept -> bool { return recurse_; }
    [[nodiscard]] auto cyclic_reference_handling() const noexcept -> CyclicReferenceHandling {
        return cyclic_reference_handling_;
    }

    void clear_all_selection_rules() { selection_rules_.clear(); }
    void clear_all_matching_rules() { matching_rules_.clear(); }

protected:
    ConfigurationBase(std::shared_ptr<const TypeRegistry> registry, std::type_index subject_type);

    void use_base_selection(std::shared_ptr<const SelectionRule> rule);
    void add_include(std::string path);
    void add_exclude(std::string path);
    void use_matching(std::shared_ptr<const MatchingRule> rule);
    void push_assertion(std::shared_ptr<const AssertionRule> rule);
    [[nodiscard]] auto type_label(std::type_index type) const -> std::string;

    std::shared_ptr<const TypeRegistry> registry_;
    std::type_index subject_type_;
    std::vector<std::shared_ptr<const SelectionRule>> selection_rules_;
    std::vector<std::shared_ptr<const MatchingRule>> matching_rules_;
    std::vector<std::shared_ptr<const AssertionRule>> assertion_rules_;
    bool recurse_{false};
    CyclicReferenceHandling cyclic_reference_handling_{CyclicReferenceHandling::throw_exception};
    std::optional<std::uint32_t> max_depth_;
    bool trace_{false};

private:
    auto validate_path(const std::string& path) const -> std::expected<void, core::error>;
};

template <class TSubject>
class Configuration : public ConfigurationBase {
public:
    /** \brief Recursive, all declared members, text and date/time compared as values. */
    static auto defaults(std::shared_ptr<const TypeRegistry> registry) -> Configuration {
        Configuration config(std::move(registry));
        config.recursive();
        config.include_all_declared_members();
        return config;
    }

    /** \brief No selection rules, must-match-by-name, non-recursive, cycles fail. */
    static auto empty(std::shared_ptr<const TypeRegistry> registry) -> Configuration {
        return Configuration(std::move(registry));
    }

    auto include_all_declared_members() -> Configuration& {
        use_base_selection(std::make_shared<AllDeclaredMembersSelectionRule>());
        return *this;
    }

    auto include_all_runtime_members() -> Configuration& {
        use_base_selection(std::make_shared<AllRuntimeMembersSelectionRule>());
        return *this;
    }

    /** \brief Pairs members by name and ignores subject members the expectation lacks. */
    auto try_match_by_name() -> Configuration& {
        use_matching(std::make_shared<TryMatchByNameRule>());
        return *this;
    }

    /** \brief Requires an equally named expectation member for every selected subject member. */
    auto must_match_by_name() -> Configuration& {
        use_matching(std::make_shared<MustMatchByNameRule>());
        return *this;
    }

    auto recursive() -> Configuration& {
        recurse_ = true;
        return *this;
    }

    auto ignore_cyclic_references() -> Configuration& {
        cyclic_reference_handling_ = CyclicReferenceHandling::ignore;
        return *this;
    }

    auto throw_on_cyclic_references() -> Configuration& {
        cyclic_reference_handling_ = CyclicReferenceHandling::throw_exception;
        return *this;
    }

    /** \brief Leaves the member at path out of the comparison. */
    auto exclude(std::string path) -> Configuration& {
        add_exclude(std::move(path));
        return *this;
    }

    /**
     * \brief Compares the member at path.
     *
     * Replaces the include-all rules: once a member is included explicitly
     * only explicitly included members are compared.
     */
    auto include(std::string path) -> Configuration& {
        add_include(std::move(path));
        return *this;
    }

    /** \brief Overrides the comparison of members whose declared type is T or derives from it. */
    template <class T>
    auto override_assertion_for(AssertionAction<T> action) -> Configuration& {
        auto registry = registry_;
        MemberPredicate predicate = [registry](const MemberDescriptor& member) {
            return registry->is_same_or_derived(member.declared_type(), typeid(T));
        };
        push_assertion(std::make_shared<TypedAssertionRule<T>>(
            std::move(predicate), std::move(action), "override for " + type_label(typeid(T))));
        return *this;
    }

    /** \brief Overrides the comparison of members accepted by predicate; their values must be viewable as T. */
    template <class T>
    auto override_assertion(MemberPredicate predicate, AssertionAction<T> action) -> Configuration& {
        push_assertion(std::make_shared<TypedAssertionRule<T>>(
            std::move(predicate), std::move(action),
            "predicate override for " + type_label(typeid(T))));
        return *this;
    }

    auto add_rule(std::shared_ptr<const SelectionRule> rule) -> Configuration& {
        selection_rules_.push_back(std::move(rule));
        return *this;
    }

    auto add_rule(std::shared_ptr<const MatchingRule> rule) -> Configuration& {
        matching_rules_.push_back(std::move(rule));
        return *this;
    }

    auto clear_all_selection_rules() -> Configuration& {
        ConfigurationBase::clear_all_selection_rules();
        return *this;
    }

    auto clear_all_matching_rules() -> Configuration& {
        ConfigurationBase::clear_all_matching_rules();
        return *this;
    }

    auto max_depth(std::uint32_t depth) -> Configuration& {
        max_depth_ = depth;
        return *this;
    }

    auto trace(bool enabled = true) -> Configuration& {
        trace_ = enabled;
        return *this;
    }

private:
    explicit Configuration(std::shared_ptr<const TypeRegistry> registry)
        : ConfigurationBase(std::move(registry), typeid(TSubject)) {
        use_matching(std::make_shared<MustMatchByNameRule>());
        override_assertion_for<std::string>(equality_action<std::string>());
        override_assertion_for<date_time>(equality_action<date_time>());
    }
};

} // namespace deepeq
