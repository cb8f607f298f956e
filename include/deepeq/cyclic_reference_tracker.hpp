#pragma once

/** \file cyclic_reference_tracker.hpp
 *  \brief Identity stack of the objects on the active recursion path.
 *
 * One tracker per comparison invocation; never shared between calls or
 * threads. Identity is (address, runtime type) so that a by-value sub-object
 * sharing its parent's address is not taken for the parent.
 */

#include <cstddef>
#include <functional>
#include <typeindex>
#include <typeinfo>
#include <unordered_set>
#include <vector>

namespace deepeq {

struct ObjectIdentity {
    const void* address{nullptr};
    std::type_index type{typeid(void)};

    friend bool operator==(const ObjectIdentity&, const ObjectIdentity&) = default;
};

struct ObjectIdentityHash {
    std::size_t operator()(const ObjectIdentity& id) const noexcept {
        const std::size_t a = std::hash<const void*>{}(id.address);
        const std::size_t t = id.type.hash_code();
        return a ^ (t + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
    }
};

class CyclicReferenceTracker {
public:
    /** \brief True when id is somewhere on the active path. */
    [[nodiscard]] auto contains(const ObjectIdentity& id) const -> bool;

    /** \brief Pushes id; returns false (and pushes nothing) if it is already on the path. */
    [[nodiscard]] auto enter(const ObjectIdentity& id) -> bool;

    /** \brief Pops the most recently entered identity. */
    void leave() noexcept;

    [[nodiscard]] auto depth() const noexcept -> std::size_t { return stack_.size(); }

private:
    std::vector<ObjectIdentity> stack_;
    std::unordered_set<ObjectIdentity, ObjectIdentityHash> active_;
};

/** \brief RAII visit: enters on construction, leaves on destruction if it entered. */
class ScopedVisit {
public:
    ScopedVisit(CyclicReferenceTracker& tracker, const ObjectIdentity& id)
        : tracker_(tracker), entered_(tracker.enter(id)) {}
    ~ScopedVisit() { if (entered_) tracker_.leave(); }

    ScopedVisit(const ScopedVisit&) = delete;
    ScopedVisit& operator=(const ScopedVisit&) = delete;

    /** \brief False when the identity was already on the path (a cycle). */
    [[nodiscard]] auto entered() const noexcept -> bool { return entered_; }

private:
    CyclicReferenceTracker& tracker_;
    bool entered_;
};

} // namespace deepeq
