#include "deepeq/rules/matching_rules.hpp"

namespace deepeq {

namespace {

auto find_by_name(const MemberDescriptor& subject_member, const MatchingContext& context)
    -> std::expected<std::optional<MemberDescriptor>, core::error> {
    auto members = context.registry.members_of(context.expectation.type);
    if (!members) return std::unexpected(members.error());
    for (auto& m : *members) {
        if (m.name() == subject_member.name()) return std::optional<MemberDescriptor>(std::move(m));
    }
    return std::optional<MemberDescriptor>();
}

} // namespace

auto MustMatchByNameRule::find_match(const MemberDescriptor& subject_member,
                                     const MatchingContext& context) const
    -> std::expected<MatchResult, core::error> {
    auto found = find_by_name(subject_member, context);
    if (!found) return std::unexpected(found.error());
    if (!*found) return MatchResult::missing();
    return MatchResult::matched(std::move(**found));
}

auto TryMatchByNameRule::find_match(const MemberDescriptor& subject_member,
                                    const MatchingContext& context) const
    -> std::expected<MatchResult, core::error> {
    auto found = find_by_name(subject_member, context);
    if (!found) return std::unexpected(found.error());
    if (!*found) return MatchResult::skipped();
    return MatchResult::matched(std::move(**found));
}

} // namespace deepeq
