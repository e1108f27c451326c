#ifndef SHIELD_OVERLAP_RESOLVER_H_
#define SHIELD_OVERLAP_RESOLVER_H_

#include <vector>

#include "core/shield_types.h"

namespace shield {

/**
 * OverlapResolver - picks a non-overlapping subset of candidate spans
 *
 * Candidates are visited by (start asc, confidence desc). A candidate that
 * overlaps an accepted match replaces it only with strictly higher
 * confidence, so ties keep the match accepted first. Output is sorted by
 * start.
 */
class OverlapResolver {
 public:
  static std::vector<PIIMatch> Resolve(std::vector<PIIMatch> matches);

  // Half-open interval intersection
  static bool Overlaps(const PIIMatch& a, const PIIMatch& b) {
    return a.start < b.end && a.end > b.start;
  }
};

}  // namespace shield

#endif  // SHIELD_OVERLAP_RESOLVER_H_
