#pragma once

/** \file matching_rules.hpp
 *  \brief Rules pairing a subject member with its counterpart on the expectation.
 */

#include <expected>
#include <optional>
#include <string>

#include "deepeq/error.hpp"
#include "deepeq/property_path.hpp"
#include "deepeq/type_registry.hpp"

namespace deepeq {

/** \brief Expectation object being searched, already resolved to its runtime type. */
struct MatchingContext {
    const TypeRegistry& registry;
    ValueRef expectation;
    const PropertyPath& path;   /**< path of the subject member being matched */
};

/** \brief Outcome of one matching attempt. */
struct MatchResult {
    enum class Kind {
        matched,   /**< counterpart found */
        skipped,   /**< no counterpart; member silently ignored */
        missing    /**< no counterpart; comparison failure */
    };

    Kind kind{Kind::skipped};
    std::optional<MemberDescriptor> counterpart;

    static auto matched(MemberDescriptor member) -> MatchResult {
        return MatchResult{Kind::matched, std::move(member)};
    }
    static auto skipped() -> MatchResult { return MatchResult{Kind::skipped, std::nullopt}; }
    static auto missing() -> MatchResult { return MatchResult{Kind::missing, std::nullopt}; }
};

class MatchingRule {
public:
    virtual ~MatchingRule() = default;

    [[nodiscard]] virtual auto find_match(const MemberDescriptor& subject_member,
                                          const MatchingContext& context) const
        -> std::expected<MatchResult, core::error> = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

/** \brief Requires an equally named member on the expectation; a missing one is a failure. */
class MustMatchByNameRule final : public MatchingRule {
public:
    [[nodiscard]] auto find_match(const MemberDescriptor& subject_member,
                                  const MatchingContext& context) const
        -> std::expected<MatchResult, core::error> override;
    [[nodiscard]] auto describe() const -> std::string override { return "must match by name"; }
};

/** \brief Pairs equally named members; members without a counterpart are skipped. */
class TryMatchByNameRule final : public MatchingRule {
public:
    [[nodiscard]] auto find_match(const MemberDescriptor& subject_member,
                                  const MatchingContext& context) const
        -> std::expected<MatchResult, core::error> override;
    [[nodiscard]] auto describe() const -> std::string override { return "try match by name"; }
};

} // namespace deepeq
