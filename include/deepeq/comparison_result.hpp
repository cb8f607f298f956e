#pragma once

/** \file comparison_result.hpp
 *  \brief Structured outcome of a comparison: success or the failing paths.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deepeq {

/** \brief Failure taxonomy reported by the engine. */
enum class FailureKind : std::uint8_t {
    value_mismatch,     /**< leaf or override comparison found subject != expectation */
    null_mismatch,      /**< exactly one side is null */
    type_mismatch,      /**< values cannot be compared as the same kind of type */
    missing_member,     /**< a required counterpart member does not exist on the expectation */
    size_mismatch,      /**< sequences differ in length */
    cyclic_reference,   /**< object re-entered along the current path */
    depth_exceeded      /**< recursion guard tripped */
};

[[nodiscard]] auto to_string(FailureKind kind) -> std::string_view;

/**
 * \brief Replaces positional placeholders {0}, {1}, ... with args.
 *
 * Placeholders without a matching argument are left untouched.
 */
[[nodiscard]] auto format_reason(std::string_view templ, const std::vector<std::string>& args) -> std::string;

/** \brief Caller-supplied justification rendered into every failure message. */
struct BecauseClause {
    std::string reason;
    std::vector<std::string> args;

    /** \brief "" when empty, otherwise " because <reason>" with args applied. */
    [[nodiscard]] auto render() const -> std::string;
};

/** \brief One failing path. */
struct ComparisonFailure {
    FailureKind kind{FailureKind::value_mismatch};
    std::string path;                      /**< dotted path from the root; empty for the root */
    std::string reason;                    /**< template with {N} placeholders */
    std::vector<std::string> reason_args;  /**< positional arguments for reason */
    std::string subject;                   /**< rendered subject value */
    std::string expectation;               /**< rendered expectation value */

    [[nodiscard]] auto message() const -> std::string { return format_reason(reason, reason_args); }
};

/** \brief Success, or every failure found in traversal order. */
class ComparisonResult {
public:
    ComparisonResult() = default;

    [[nodiscard]] auto success() const noexcept -> bool { return failures_.empty(); }
    explicit operator bool() const noexcept { return success(); }

    [[nodiscard]] auto failures() const noexcept -> const std::vector<ComparisonFailure>& { return failures_; }

    /** \brief Earliest failure, or nullptr on success. */
    [[nodiscard]] auto first() const noexcept -> const ComparisonFailure* {
        return failures_.empty() ? nullptr : &failures_.front();
    }

    /** \brief All failure messages, one per line. */
    [[nodiscard]] auto summary() const -> std::string;

    void add(ComparisonFailure failure) { failures_.push_back(std::move(failure)); }

private:
    std::vector<ComparisonFailure> failures_;
};

} // namespace deepeq
