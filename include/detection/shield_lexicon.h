#ifndef SHIELD_LEXICON_H_
#define SHIELD_LEXICON_H_

#include <string>
#include <unordered_set>

namespace shield {

using WordSet = std::unordered_set<std::string>;

/**
 * Curated word lists used by the lexical name and address heuristics.
 *
 * All entries are lower case without punctuation. A Lexicon is immutable
 * once built; the detector holds it by reference, so one instance can be
 * shared across any number of detectors and threads.
 */
class Lexicon {
 public:
  Lexicon(WordSet name_prefixes,
          WordSet name_suffixes,
          WordSet common_first_names,
          WordSet street_types);

  // Process-wide built-in lists, constructed on first use
  static const Lexicon& Default();

  bool IsNamePrefix(const std::string& lower_word) const {
    return name_prefixes_.count(lower_word) > 0;
  }
  bool IsNameSuffix(const std::string& lower_word) const {
    return name_suffixes_.count(lower_word) > 0;
  }
  bool IsCommonFirstName(const std::string& lower_word) const {
    return common_first_names_.count(lower_word) > 0;
  }

  // "(?:street|avenue|...)" alternation (escaped), longest words first so the
  // output is stable regardless of hash order
  std::string StreetTypeAlternation() const;

 private:
  const WordSet name_prefixes_;
  const WordSet name_suffixes_;
  const WordSet common_first_names_;
  const WordSet street_types_;
};

}  // namespace shield

#endif  // SHIELD_LEXICON_H_
