#include "deepeq/rules/selection_rules.hpp"

#include <algorithm>

namespace deepeq {

namespace {

auto contains_name(const std::vector<MemberDescriptor>& members, const std::string& name) -> bool {
    return std::any_of(members.begin(), members.end(),
                       [&](const MemberDescriptor& m) { return m.name() == name; });
}

// Index-free form matched against PropertyPath::member_path(). A path that does
// not parse is kept verbatim so build() reports it.
auto normalize(std::string path) -> std::string {
    auto parsed = PropertyPath::parse(path);
    return parsed ? parsed->member_path() : path;
}

} // namespace

IncludeMemberSelectionRule::IncludeMemberSelectionRule(std::string path)
    : path_(normalize(std::move(path))) {}

ExcludeMemberSelectionRule::ExcludeMemberSelectionRule(std::string path)
    : path_(normalize(std::move(path))) {}

auto AllDeclaredMembersSelectionRule::select_members(std::vector<MemberDescriptor> /*selected*/,
                                                     const SelectionContext& context) const
    -> std::expected<std::vector<MemberDescriptor>, core::error> {
    return context.registry.members_of(context.declared_type);
}

auto AllRuntimeMembersSelectionRule::select_members(std::vector<MemberDescriptor> /*selected*/,
                                                    const SelectionContext& context) const
    -> std::expected<std::vector<MemberDescriptor>, core::error> {
    return context.registry.members_of(context.runtime_type);
}

auto IncludeMemberSelectionRule::select_members(std::vector<MemberDescriptor> selected,
                                                const SelectionContext& context) const
    -> std::expected<std::vector<MemberDescriptor>, core::error> {
    // Below the included member the whole subtree takes part.
    const std::string here = context.path.member_path();
    const bool inside = !here.empty() &&
                        (here == path_ || (here.size() > path_.size() &&
                                           here.compare(0, path_.size(), path_) == 0 &&
                                           here[path_.size()] == '.'));
    auto candidates = inside ? context.registry.members_of(context.declared_type)
                             : context.registry.members_of(context.runtime_type);
    if (!candidates) return std::unexpected(candidates.error());

    for (auto& m : *candidates) {
        if (inside) {
            if (!contains_name(selected, m.name())) selected.push_back(std::move(m));
            continue;
        }
        const std::string member_path = context.path.member(m.name()).member_path();
        const bool exact = member_path == path_;
        const bool ancestor = path_.size() > member_path.size() &&
                              path_.compare(0, member_path.size(), member_path) == 0 &&
                              path_[member_path.size()] == '.';
        if ((exact || ancestor) && !contains_name(selected, m.name())) {
            selected.push_back(std::move(m));
        }
    }
    return selected;
}

auto ExcludeMemberSelectionRule::select_members(std::vector<MemberDescriptor> selected,
                                                const SelectionContext& context) const
    -> std::expected<std::vector<MemberDescriptor>, core::error> {
    std::erase_if(selected, [&](const MemberDescriptor& m) {
        return context.path.member(m.name()).member_path() == path_;
    });
    return selected;
}

} // namespace deepeq
