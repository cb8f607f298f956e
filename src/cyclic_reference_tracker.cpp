#include "deepeq/cyclic_reference_tracker.hpp"

namespace deepeq {

auto CyclicReferenceTracker::contains(const ObjectIdentity& id) const -> bool {
    return active_.find(id) != active_.end();
}

auto CyclicReferenceTracker::enter(const ObjectIdentity& id) -> bool {
    if (!active_.insert(id).second) return false;
    stack_.push_back(id);
    return true;
}

void CyclicReferenceTracker::leave() noexcept {
    if (stack_.empty()) return;
    active_.erase(stack_.back());
    stack_.pop_back();
}

} // namespace deepeq
