/** \file comparison_engine.cpp
 *  \brief Traversal state machine: select, match, resolve override, compare or recurse.
 */

#include "deepeq/comparison_engine.hpp"

#include <iostream>
#include <optional>
#include <string_view>

#include "deepeq/cyclic_reference_tracker.hpp"
#include "deepeq/property_path.hpp"
#include "deepeq/rules/assertion_rules.hpp"
#include "deepeq/rules/matching_rules.hpp"
#include "deepeq/rules/selection_rules.hpp"

namespace deepeq {

namespace {

// {0} what is compared, {1} expected, {2} found, {3} because-clause
constexpr std::string_view kValueMismatch = "Expected {0} to be {1}{3}, but found {2}.";
constexpr std::string_view kTypeMismatch = "Expected {0} to be of type {1}{3}, but found {2}.";
constexpr std::string_view kSizeMismatch = "Expected {0} to contain {1} item(s){3}, but found {2}.";
// {0} what is compared, {1} because-clause
constexpr std::string_view kMissingMember =
    "Expected {0} to have a counterpart on the expectation{1}, but it has none.";
constexpr std::string_view kCyclicReference =
    "Expected {0} to be compared without cyclic references{1}, but it refers back to an object already being compared.";
// {0} what is compared, {1} depth limit, {2} because-clause
constexpr std::string_view kDepthExceeded =
    "Expected {0} to be compared within {1} level(s) of nesting{2}, but the maximum recursion depth was exceeded.";

/** \brief State of one root-level comparison: failures found so far and the active path. */
class Traversal {
public:
    Traversal(const ComparisonPlan& plan, const BecauseClause& because)
        : plan_(plan)
        , registry_(plan.registry())
        , because_(because)
        , because_text_(because.render()) {}

    auto run(ValueRef subject, ValueRef expectation) -> std::expected<ComparisonResult, core::error> {
        if (auto r = compare_pair(nullptr, subject, expectation, PropertyPath{}, 0); !r) {
            return std::unexpected(r.error());
        }
        if (plan_.trace()) {
            std::cerr << "[DEEPEQ][engine] done: " << result_.failures().size() << " failure(s)" << std::endl;
        }
        return std::move(result_);
    }

private:
    auto compare_pair(const MemberDescriptor* member, ValueRef subject, ValueRef expectation,
                      const PropertyPath& path, std::uint32_t depth) -> std::expected<void, core::error>;
    auto compare_structure(std::type_index declared_type, ValueRef subject, ValueRef expectation,
                           const PropertyPath& path, std::uint32_t depth) -> std::expected<void, core::error>;
    auto compare_sequence(ValueRef subject, ValueRef expectation, const TypeDesc& subject_desc,
                          const TypeDesc& expectation_desc, const PropertyPath& path, std::uint32_t depth)
        -> std::expected<void, core::error>;
    void compare_leaf(ValueRef subject, ValueRef expectation, const TypeDesc& desc, const PropertyPath& path);
    void compare_direct(ValueRef subject, ValueRef expectation, const TypeDesc& desc, const PropertyPath& path);

    auto find_counterpart(const MemberDescriptor& member, ValueRef expectation, const PropertyPath& path)
        -> std::expected<MatchResult, core::error>;

    auto within_depth(ValueRef subject, ValueRef expectation, const PropertyPath& path, std::uint32_t depth) -> bool;
    void on_cycle(ValueRef subject, ValueRef expectation, const PropertyPath& path);

    void fail(FailureKind kind, const PropertyPath& path, std::string_view reason,
              std::vector<std::string> args, ValueRef subject, ValueRef expectation);
    void trace(std::string_view what, const PropertyPath& path) const;

    auto unregistered(std::type_index type, const PropertyPath& path) const -> core::error {
        return core::error{core::error_code::config_invalid,
            std::string("type is not registered: ") + type.name() + " at " + path.describe(), "deepeq.engine"};
    }

    const ComparisonPlan& plan_;
    const TypeRegistry& registry_;
    const BecauseClause& because_;
    std::string because_text_;
    CyclicReferenceTracker tracker_;
    ComparisonResult result_;
};

auto Traversal::compare_pair(const MemberDescriptor* member, ValueRef subject, ValueRef expectation,
                             const PropertyPath& path, std::uint32_t depth)
    -> std::expected<void, core::error> {
    if (subject.address == expectation.address &&
        (subject.is_null() || subject.type == expectation.type)) {
        return {};
    }
    if (subject.is_null() || expectation.is_null()) {
        fail(FailureKind::null_mismatch, path, kValueMismatch,
             {path.describe(), registry_.render(expectation), registry_.render(subject), because_text_},
             subject, expectation);
        return {};
    }

    if (member) {
        if (const AssertionRule* rule = resolve_assertion(plan_.assertion_rules(), *member)) {
            trace(rule->describe(), path);
            auto equal = rule->assert_equality(registry_, subject, expectation, path, because_);
            if (!equal) return std::unexpected(equal.error());
            if (!*equal) {
                fail(FailureKind::value_mismatch, path, kValueMismatch,
                     {path.describe(), registry_.render(expectation), registry_.render(subject), because_text_},
                     subject, expectation);
            }
            return {};
        }
    }

    const ValueRef s = registry_.resolve_runtime(subject);
    const ValueRef e = registry_.resolve_runtime(expectation);
    const TypeDesc* sd = registry_.find(s.type);
    if (!sd) return std::unexpected(unregistered(s.type, path));
    const TypeDesc* ed = registry_.find(e.type);
    if (!ed) return std::unexpected(unregistered(e.type, path));

    const bool descend = depth == 0 || plan_.recurse();
    if (sd->kind == TypeKind::leaf) {
        compare_leaf(s, e, *sd, path);
        return {};
    }
    if (sd->kind != ed->kind) {
        fail(FailureKind::type_mismatch, path, kTypeMismatch,
             {path.describe(), registry_.type_name(e.type), registry_.type_name(s.type), because_text_},
             s, e);
        return {};
    }
    if (!descend) {
        compare_direct(s, e, *sd, path);
        return {};
    }
    if (sd->kind == TypeKind::sequence) return compare_sequence(s, e, *sd, *ed, path, depth);
    return compare_structure(subject.type, s, e, path, depth);
}

auto Traversal::compare_structure(std::type_index declared_type, ValueRef subject, ValueRef expectation,
                                  const PropertyPath& path, std::uint32_t depth)
    -> std::expected<void, core::error> {
    if (!within_depth(subject, expectation, path, depth)) return {};
    ScopedVisit visit(tracker_, ObjectIdentity{subject.address, subject.type});
    if (!visit.entered()) {
        on_cycle(subject, expectation, path);
        return {};
    }
    trace("structure of " + registry_.type_name(subject.type), path);

    const SelectionContext context{registry_, declared_type, subject.type, path};
    std::vector<MemberDescriptor> selected;
    for (const auto& rule : plan_.selection_rules()) {
        auto next = rule->select_members(std::move(selected), context);
        if (!next) return std::unexpected(next.error());
        selected = std::move(*next);
    }

    for (const auto& m : selected) {
        const PropertyPath child = path.member(m.name());
        auto match = find_counterpart(m, expectation, child);
        if (!match) return std::unexpected(match.error());
        if (match->kind == MatchResult::Kind::skipped) {
            trace("no counterpart, skipped", child);
            continue;
        }
        if (match->kind == MatchResult::Kind::missing) {
            fail(FailureKind::missing_member, child, kMissingMember, {child.describe(), because_text_},
                 ValueRef{}, ValueRef{});
            continue;
        }

        auto subject_value = registry_.read_member(subject, m);
        if (!subject_value) return std::unexpected(subject_value.error());
        auto expectation_value = registry_.read_member(expectation, *match->counterpart);
        if (!expectation_value) return std::unexpected(expectation_value.error());

        if (auto r = compare_pair(&m, *subject_value, *expectation_value, child, depth + 1); !r) return r;
    }
    return {};
}

auto Traversal::compare_sequence(ValueRef subject, ValueRef expectation, const TypeDesc& subject_desc,
                                 const TypeDesc& expectation_desc, const PropertyPath& path, std::uint32_t depth)
    -> std::expected<void, core::error> {
    if (!within_depth(subject, expectation, path, depth)) return {};
    ScopedVisit visit(tracker_, ObjectIdentity{subject.address, subject.type});
    if (!visit.entered()) {
        on_cycle(subject, expectation, path);
        return {};
    }

    const std::size_t actual = subject_desc.size(subject.address);
    const std::size_t expected = expectation_desc.size(expectation.address);
    if (actual != expected) {
        fail(FailureKind::size_mismatch, path, kSizeMismatch,
             {path.describe(), std::to_string(expected), std::to_string(actual), because_text_},
             subject, expectation);
        return {};
    }

    for (std::size_t i = 0; i < actual; ++i) {
        const MemberDescriptor element("[" + std::to_string(i) + "]", subject_desc.element_type, subject.type,
            [read = subject_desc.element, i](const void* owner) { return read(owner, i); });
        const ValueRef s = subject_desc.element(subject.address, i);
        const ValueRef e = expectation_desc.element(expectation.address, i);
        if (auto r = compare_pair(&element, s, e, path.index(i), depth + 1); !r) return r;
    }
    return {};
}

void Traversal::compare_leaf(ValueRef subject, ValueRef expectation, const TypeDesc& desc,
                             const PropertyPath& path) {
    if (subject.type != expectation.type) {
        fail(FailureKind::type_mismatch, path, kTypeMismatch,
             {path.describe(), registry_.type_name(expectation.type), registry_.type_name(subject.type), because_text_},
             subject, expectation);
        return;
    }
    const bool equal = desc.equals ? desc.equals(subject.address, expectation.address)
                                   : subject.address == expectation.address;
    if (!equal) {
        fail(FailureKind::value_mismatch, path, kValueMismatch,
             {path.describe(), registry_.render(expectation), registry_.render(subject), because_text_},
             subject, expectation);
    }
}

// Non-recursive comparison: registered equality for same-typed values, identity otherwise.
void Traversal::compare_direct(ValueRef subject, ValueRef expectation, const TypeDesc& desc,
                               const PropertyPath& path) {
    const bool equal = (subject.type == expectation.type && desc.equals)
                           ? desc.equals(subject.address, expectation.address)
                           : subject.address == expectation.address;
    if (!equal) {
        fail(FailureKind::value_mismatch, path, kValueMismatch,
             {path.describe(), registry_.render(expectation), registry_.render(subject), because_text_},
             subject, expectation);
    }
}

auto Traversal::find_counterpart(const MemberDescriptor& member, ValueRef expectation, const PropertyPath& path)
    -> std::expected<MatchResult, core::error> {
    const MatchingContext context{registry_, expectation, path};
    bool required = false;
    for (const auto& rule : plan_.matching_rules()) {
        auto r = rule->find_match(member, context);
        if (!r) return std::unexpected(r.error());
        if (r->kind == MatchResult::Kind::matched) return r;
        if (r->kind == MatchResult::Kind::missing) required = true;
    }
    return required ? MatchResult::missing() : MatchResult::skipped();
}

auto Traversal::within_depth(ValueRef subject, ValueRef expectation, const PropertyPath& path,
                             std::uint32_t depth) -> bool {
    if (depth < plan_.max_depth()) return true;
    fail(FailureKind::depth_exceeded, path, kDepthExceeded,
         {path.describe(), std::to_string(plan_.max_depth()), because_text_}, subject, expectation);
    return false;
}

void Traversal::on_cycle(ValueRef subject, ValueRef expectation, const PropertyPath& path) {
    if (plan_.cyclic_reference_handling() == CyclicReferenceHandling::ignore) {
        trace("cyclic reference ignored", path);
        return;
    }
    fail(FailureKind::cyclic_reference, path, kCyclicReference, {path.describe(), because_text_},
         subject, expectation);
}

void Traversal::fail(FailureKind kind, const PropertyPath& path, std::string_view reason,
                     std::vector<std::string> args, ValueRef subject, ValueRef expectation) {
    ComparisonFailure failure;
    failure.kind = kind;
    failure.path = path.str();
    failure.reason = std::string(reason);
    failure.reason_args = std::move(args);
    failure.subject = registry_.render(subject);
    failure.expectation = registry_.render(expectation);
    if (plan_.trace()) {
        std::cerr << "[DEEPEQ][engine] " << to_string(kind) << ": " << failure.message() << std::endl;
    }
    result_.add(std::move(failure));
}

void Traversal::trace(std::string_view what, const PropertyPath& path) const {
    if (!plan_.trace()) return;
    std::cerr << "[DEEPEQ][engine] " << path.describe() << ": " << what << std::endl;
}

} // namespace

auto ComparisonEngine::compare(ValueRef subject, ValueRef expectation, const BecauseClause& because) const
    -> std::expected<ComparisonResult, core::error> {
    if (!plan_.registry().is_same_or_derived(subject.type, plan_.subject_type())) {
        return std::unexpected(core::error{core::error_code::precondition_failed,
            "plan was built for " + plan_.registry().type_name(plan_.subject_type()) +
            " but the subject is " + plan_.registry().type_name(subject.type), "deepeq.engine"});
    }
    Traversal traversal(plan_, because);
    return traversal.run(subject, expectation);
}

} // namespace deepeq
