/** \file configuration.cpp
 *  \brief Rule-list bookkeeping and plan validation for Configuration.
 */

#include "deepeq/configuration.hpp"

#include <algorithm>
#include <iostream>
#include <string>

#include "deepeq/core/platform_utils.hpp"

namespace deepeq {

namespace {

auto is_include_all_rule(const std::shared_ptr<const SelectionRule>& rule) -> bool {
    return dynamic_cast<const AllDeclaredMembersSelectionRule*>(rule.get()) != nullptr ||
           dynamic_cast<const AllRuntimeMembersSelectionRule*>(rule.get()) != nullptr;
}

// Steps through sequence types to the element type they hold.
auto unwrap_sequences(const TypeRegistry& registry, std::type_index type) -> std::type_index {
    const TypeDesc* desc = registry.find(type);
    while (desc && desc->kind == TypeKind::sequence) {
        type = desc->element_type;
        desc = registry.find(type);
    }
    return type;
}

} // namespace

ConfigurationBase::ConfigurationBase(std::shared_ptr<const TypeRegistry> registry,
                                     std::type_index subject_type)
    : registry_(std::move(registry))
    , subject_type_(subject_type) {}

void ConfigurationBase::use_base_selection(std::shared_ptr<const SelectionRule> rule) {
    selection_rules_.clear();
    selection_rules_.push_back(std::move(rule));
}

void ConfigurationBase::add_include(std::string path) {
    std::erase_if(selection_rules_, is_include_all_rule);
    selection_rules_.push_back(std::make_shared<IncludeMemberSelectionRule>(std::move(path)));
}

void ConfigurationBase::add_exclude(std::string path) {
    selection_rules_.push_back(std::make_shared<ExcludeMemberSelectionRule>(std::move(path)));
}

void ConfigurationBase::use_matching(std::shared_ptr<const MatchingRule> rule) {
    matching_rules_.clear();
    matching_rules_.push_back(std::move(rule));
}

void ConfigurationBase::push_assertion(std::shared_ptr<const AssertionRule> rule) {
    assertion_rules_.insert(assertion_rules_.begin(), std::move(rule));
}

auto ConfigurationBase::type_label(std::type_index type) const -> std::string {
    return registry_ ? registry_->type_name(type) : std::string(type.name());
}

auto ConfigurationBase::validate_path(const std::string& path) const
    -> std::expected<void, core::error> {
    using core::error; using core::error_code;
    auto parsed = PropertyPath::parse(path);
    if (!parsed) {
        return std::unexpected(error{error_code::config_invalid, parsed.error().message, "deepeq.plan"});
    }

    std::type_index current = subject_type_;
    for (const auto& segment : parsed->segments()) {
        // A member may live on the type itself or on any registered type deriving from it.
        std::vector<std::type_index> candidates{current};
        auto derived = registry_->derived_types(current);
        candidates.insert(candidates.end(), derived.begin(), derived.end());

        std::optional<std::type_index> next;
        for (auto type : candidates) {
            auto members = registry_->members_of(type);
            if (!members) continue;
            auto it = std::find_if(members->begin(), members->end(),
                                   [&](const MemberDescriptor& m) { return m.name() == segment.name; });
            if (it != members->end()) {
                next = it->declared_type();
                break;
            }
        }
        if (!next) {
            return std::unexpected(error{error_code::config_invalid,
                "member path '" + path + "' does not resolve: " + registry_->type_name(current) +
                " has no member '" + segment.name + "'", "deepeq.plan"});
        }
        current = unwrap_sequences(*registry_, *next);
    }
    return {};
}

auto ConfigurationBase::build() const -> std::expected<ComparisonPlan, core::error> {
    using core::error; using core::error_code;
    if (!registry_) {
        return std::unexpected(error{error_code::config_invalid, "no type registry", "deepeq.plan"});
    }
    if (!registry_->contains(subject_type_)) {
        return std::unexpected(error{error_code::config_invalid,
            std::string("subject type is not registered: ") + subject_type_.name(), "deepeq.plan"});
    }
    if (matching_rules_.empty()) {
        return std::unexpected(error{error_code::config_invalid,
            "at least one matching rule is required", "deepeq.plan"});
    }
    for (const auto& rule : selection_rules_) {
        if (!rule) {
            return std::unexpected(error{error_code::config_invalid, "null selection rule", "deepeq.plan"});
        }
        const std::string* path = nullptr;
        if (const auto* inc = dynamic_cast<const IncludeMemberSelectionRule*>(rule.get())) path = &inc->path();
        if (const auto* exc = dynamic_cast<const ExcludeMemberSelectionRule*>(rule.get())) path = &exc->path();
        if (path) {
            if (auto ok = validate_path(*path); !ok) return std::unexpected(ok.error());
        }
    }
    for (const auto& rule : matching_rules_) {
        if (!rule) {
            return std::unexpected(error{error_code::config_invalid, "null matching rule", "deepeq.plan"});
        }
    }

    std::uint32_t depth = kDefaultMaxDepth;
    if (max_depth_) {
        if (*max_depth_ == 0) {
            return std::unexpected(error{error_code::config_invalid, "max_depth must be positive", "deepeq.plan"});
        }
        if (*max_depth_ > kMaxDepthCeiling) {
            return std::unexpected(error{error_code::resource_exhausted,
                "max_depth " + std::to_string(*max_depth_) + " exceeds the ceiling of " +
                std::to_string(kMaxDepthCeiling), "deepeq.plan"});
        }
        depth = *max_depth_;
    } else if (auto env_depth = core::env_u32("DEEPEQ_MAX_DEPTH")) {
        depth = *env_depth;
        if (depth > kMaxDepthCeiling) {
            std::cerr << "[DEEPEQ][plan] DEEPEQ_MAX_DEPTH=" << depth << " clamped to "
                      << kMaxDepthCeiling << std::endl;
            depth = kMaxDepthCeiling;
        }
    }

    ComparisonPlan plan;
    plan.registry_ = registry_;
    plan.subject_type_ = subject_type_;
    plan.selection_rules_ = selection_rules_;
    plan.matching_rules_ = matching_rules_;
    plan.assertion_rules_ = assertion_rules_;
    plan.recurse_ = recurse_;
    plan.cyclic_reference_handling_ = cyclic_reference_handling_;
    plan.max_depth_ = depth;
    plan.trace_ = trace_ || core::env_flag("DEEPEQ_TRACE");

    if (plan.trace_) {
        std::cerr << "[DEEPEQ][plan] built for " << registry_->type_name(subject_type_)
                  << ": selection=" << plan.selection_rules_.size()
                  << " matching=" << plan.matching_rules_.size()
                  << " assertion=" << plan.assertion_rules_.size()
                  << " recurse=" << (plan.recurse_ ? 1 : 0)
                  << " cycles=" << (plan.cyclic_reference_handling_ == CyclicReferenceHandling::ignore ? "ignore" : "fail")
                  << " max_depth=" << plan.max_depth_ << std::endl;
        for (const auto& rule : plan.selection_rules_) {
            std::cerr << "[DEEPEQ][plan]   " << rule->describe() << std::endl;
        }
    }
    return plan;
}

} // namespace deepeq
