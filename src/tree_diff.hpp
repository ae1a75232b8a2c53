#pragma once

#include "value.hpp"

namespace replicator {

// Sparse description of a state transition.
//   added[k]   - new value at k, or a nested added-table when k is a table
//                on both sides
//   removed[k] - `true` if k disappeared, or a nested removed-table
struct diff_pair {
    table added;
    table removed;

    bool empty() const { return added.empty() && removed.empty(); }
};

// Compute the structural delta turning `previous` into `current`.
// Both halves are maximally sparse: diff(a, a) is two empty tables.
diff_pair diff(const table& previous, const table& current);

// Apply a delta in place. Added is applied fully before Removed.
// merge(copy_of_a, diff(a, b)) yields b, and re-applying is a no-op.
void merge(table& target, const table& added, const table& removed);
inline void merge(table& target, const diff_pair& d) { merge(target, d.added, d.removed); }

// Fill keys present in `defaults` but missing from `target`, recursing where
// both sides hold tables. Existing keys are never overwritten.
// Returns true if anything was added.
bool reconcile(table& target, const table& defaults);

} // namespace replicator
