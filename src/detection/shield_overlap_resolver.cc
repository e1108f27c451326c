#include "detection/shield_overlap_resolver.h"

#include <algorithm>
#include <utility>

namespace shield {

std::vector<PIIMatch> OverlapResolver::Resolve(std::vector<PIIMatch> matches) {
  if (matches.empty()) {
    return matches;
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const PIIMatch& a, const PIIMatch& b) {
                     if (a.start != b.start) return a.start < b.start;
                     return a.confidence > b.confidence;
                   });

  std::vector<PIIMatch> result;
  result.reserve(matches.size());

  for (auto& candidate : matches) {
    // Accepted spans are disjoint and start no later than the candidate,
    // so at most one of them can contain candidate.start
    auto existing = std::find_if(result.begin(), result.end(),
                                 [&](const PIIMatch& m) { return Overlaps(candidate, m); });
    if (existing == result.end()) {
      result.push_back(std::move(candidate));
    } else if (candidate.confidence > existing->confidence) {
      result.erase(existing);
      result.push_back(std::move(candidate));
    }
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const PIIMatch& a, const PIIMatch& b) { return a.start < b.start; });
  return result;
}

}  // namespace shield
