#pragma once

/** \file selection_rules.hpp
 *  \brief Rules deciding which members of a type take part in a comparison.
 *
 * Rules form an ordered chain: each receives the members selected by the
 * rules before it and returns a new selection. Base rules (all declared /
 * all runtime members) replace the incoming selection; include rules add to
 * it; exclude rules remove from it.
 */

#include <expected>
#include <string>
#include <typeindex>
#include <vector>

#include "deepeq/error.hpp"
#include "deepeq/property_path.hpp"
#include "deepeq/type_registry.hpp"

namespace deepeq {

/** \brief What a selection rule may look at for the object being compared. */
struct SelectionContext {
    const TypeRegistry& registry;
    std::type_index declared_type;   /**< static type of the location holding the object */
    std::type_index runtime_type;    /**< most-derived registered type of the object */
    const PropertyPath& path;        /**< path of the object itself */
};

class SelectionRule {
public:
    virtual ~SelectionRule() = default;

    [[nodiscard]] virtual auto select_members(std::vector<MemberDescriptor> selected,
                                              const SelectionContext& context) const
        -> std::expected<std::vector<MemberDescriptor>, core::error> = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

/** \brief Every member visible on the declared type (including inherited ones). */
class AllDeclaredMembersSelectionRule final : public SelectionRule {
public:
    [[nodiscard]] auto select_members(std::vector<MemberDescriptor> selected,
                                      const SelectionContext& context) const
        -> std::expected<std::vector<MemberDescriptor>, core::error> override;
    [[nodiscard]] auto describe() const -> std::string override { return "include all declared members"; }
};

/** \brief Every member visible on the runtime type, so derived-only members surface too. */
class AllRuntimeMembersSelectionRule final : public SelectionRule {
public:
    [[nodiscard]] auto select_members(std::vector<MemberDescriptor> selected,
                                      const SelectionContext& context) const
        -> std::expected<std::vector<MemberDescriptor>, core::error> override;
    [[nodiscard]] auto describe() const -> std::string override { return "include all runtime members"; }
};

/**
 * \brief Adds the member at a path, and every ancestor member needed to reach it.
 *
 * Including "Address.Street" selects Address on the root and Street inside it.
 * Members below the included one are all compared. Sequence indices are
 * dropped: "Orders[0].Id" includes the Id of every order.
 */
class IncludeMemberSelectionRule final : public SelectionRule {
public:
    explicit IncludeMemberSelectionRule(std::string path);

    [[nodiscard]] auto select_members(std::vector<MemberDescriptor> selected,
                                      const SelectionContext& context) const
        -> std::expected<std::vector<MemberDescriptor>, core::error> override;
    [[nodiscard]] auto describe() const -> std::string override { return "include " + path_; }
    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

private:
    std::string path_;
};

/**
 * \brief Removes the member at a path. Excluding a member that was never selected is a no-op.
 *
 * Sequence indices are dropped as for includes.
 */
class ExcludeMemberSelectionRule final : public SelectionRule {
public:
    explicit ExcludeMemberSelectionRule(std::string path);

    [[nodiscard]] auto select_members(std::vector<MemberDescriptor> selected,
                                      const SelectionContext& context) const
        -> std::expected<std::vector<MemberDescriptor>, core::error> override;
    [[nodiscard]] auto describe() const -> std::string override { return "exclude " + path_; }
    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

private:
    std::string path_;
};

} // namespace deepeq
