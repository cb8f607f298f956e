#include "deepeq/rules/assertion_rules.hpp"

namespace deepeq {

auto resolve_assertion(const std::vector<std::shared_ptr<const AssertionRule>>& rules,
                       const MemberDescriptor& member) -> const AssertionRule* {
    for (const auto& rule : rules) {
        if (rule && rule->applies_to(member)) return rule.get();
    }
    return nullptr;
}

} // namespace deepeq
