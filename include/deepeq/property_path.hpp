#pragma once

/** \file property_path.hpp
 *  \brief Path from the comparison root to the member currently compared.
 *
 * Rendered as dotted member names with sequence indices in brackets,
 * e.g. "Orders[2].Lines[0].Sku". The root is the empty path.
 * Value-semantic: each recursion level extends a copy.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "deepeq/error.hpp"

namespace deepeq {

class PropertyPath {
public:
    /** \brief One step: a member name or a sequence index. */
    struct Segment {
        std::string name;
        std::optional<std::size_t> index;
    };

    PropertyPath() = default;

    /**
     * \brief Parses a dotted member path such as "Address.Street".
     *
     * Bracketed indices are accepted and dropped ("Orders[1].Id" parses as
     * "Orders.Id"); empty segments are rejected with invalid_argument.
     */
    static auto parse(std::string_view dotted) -> std::expected<PropertyPath, core::error>;

    [[nodiscard]] auto member(std::string_view name) const -> PropertyPath;
    [[nodiscard]] auto index(std::size_t i) const -> PropertyPath;

    [[nodiscard]] auto str() const -> std::string;

    /** \brief Rendering without sequence indices, used to match include/exclude paths. */
    [[nodiscard]] auto member_path() const -> std::string;

    [[nodiscard]] auto empty() const noexcept -> bool { return segments_.empty(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return segments_.size(); }
    [[nodiscard]] auto segments() const noexcept -> const std::vector<Segment>& { return segments_; }

    /** \brief "subject" for the root, otherwise "member <path>". */
    [[nodiscard]] auto describe() const -> std::string;

private:
    std::vector<Segment> segments_;
};

} // namespace deepeq
