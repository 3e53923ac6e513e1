#pragma once

#include "checklist.hpp"

struct ProgressCount {
  int done = 0;
  int total = 0;
};

// Counts every node; a node is done when it is marked done or an earlier
// parent in the same chain was done. Leaves the tree untouched.
ProgressCount count_progress(const ChecklistTree& tree);

// Returns a copy in which every node counted as done is marked done.
ChecklistTree apply_rest_done(const ChecklistTree& tree);

// In-place variant of apply_rest_done followed by count_progress.
// The marks written here are what the canonical rewrite persists.
ProgressCount calculate_progress(ChecklistTree& tree);

// done / total * 100; an empty checklist reports 0.
double completion_percentage(const ProgressCount& count);
