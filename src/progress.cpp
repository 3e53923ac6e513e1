#include "progress.hpp"

namespace {

template<typename Entry, typename Visitor>
void walk_chain(Entry& entry, Visitor&& visit) {
  bool rest_done = false;
  for(auto* node = &entry; node; node = node->sub.get()) {
    const bool counted = node->done || rest_done;
    if(counted && node->has_sub()) {
      rest_done = true;
    }
    visit(*node, counted);
  }
}

} // namespace

ProgressCount count_progress(const ChecklistTree& tree) {
  ProgressCount count;
  for(const auto& entry : tree) {
    walk_chain(entry, [&](const ChecklistEntry&, bool counted){
      if(counted) ++count.done;
      ++count.total;
    });
  }
  return count;
}

ChecklistTree apply_rest_done(const ChecklistTree& tree) {
  ChecklistTree result = tree;
  calculate_progress(result);
  return result;
}

ProgressCount calculate_progress(ChecklistTree& tree) {
  ProgressCount count;
  for(auto& entry : tree) {
    walk_chain(entry, [&](ChecklistEntry& node, bool counted){
      if(counted) {
        node.done = true;
        ++count.done;
      }
      ++count.total;
    });
  }
  return count;
}

double completion_percentage(const ProgressCount& count) {
  if(count.total == 0) return 0.0;
  return static_cast<double>(count.done) / static_cast<double>(count.total) * 100.0;
}
