#include "detection/shield_lexicon.h"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <utility>
#include <vector>

namespace shield {

Lexicon::Lexicon(WordSet name_prefixes,
                 WordSet name_suffixes,
                 WordSet common_first_names,
                 WordSet street_types)
    : name_prefixes_(std::move(name_prefixes)),
      name_suffixes_(std::move(name_suffixes)),
      common_first_names_(std::move(common_first_names)),
      street_types_(std::move(street_types)) {}

const Lexicon& Lexicon::Default() {
  static const Lexicon lexicon(
      // Honorific prefixes
      {
        "mr", "mrs", "ms", "miss", "dr", "prof", "rev",
        "hon", "sir", "lord", "lady", "capt", "col", "gen",
        "lt", "sgt", "cpl", "pvt", "adm", "cmdr", "maj"
      },
      // Name suffixes
      {
        "jr", "sr", "ii", "iii", "iv", "v", "esq", "md", "phd",
        "dds", "jd", "cpa", "rn", "dvm", "do", "od", "pharmd"
      },
      // Common first names
      {
        "james", "john", "robert", "michael", "william", "david",
        "richard", "joseph", "thomas", "charles", "christopher", "daniel",
        "matthew", "anthony", "mark", "donald", "steven", "paul",
        "andrew", "joshua", "kenneth", "kevin", "brian", "george",
        "edward", "ronald", "timothy", "jason", "jeffrey", "ryan",
        "mary", "patricia", "jennifer", "linda", "barbara", "elizabeth",
        "susan", "jessica", "sarah", "karen", "nancy", "lisa",
        "betty", "margaret", "sandra", "ashley", "kimberly", "emily",
        "donna", "michelle", "dorothy", "carol", "amanda", "melissa",
        "deborah", "stephanie", "rebecca", "sharon", "laura", "cynthia",
        "kathleen", "amy", "angela", "shirley", "anna", "brenda",
        "pamela", "emma", "nicole", "helen", "samantha", "katherine"
      },
      // Street types
      {
        "street", "st", "avenue", "ave", "road", "rd", "boulevard",
        "blvd", "lane", "ln", "drive", "dr", "court", "ct", "circle",
        "cir", "way", "place", "pl", "terrace", "ter", "parkway", "pkwy",
        "highway", "hwy", "trail", "path", "alley", "walk", "plaza",
        "square", "loop", "crescent", "creek", "crossing", "bend"
      });
  return lexicon;
}

std::string Lexicon::StreetTypeAlternation() const {
  std::vector<std::string> words(street_types_.begin(), street_types_.end());
  std::sort(words.begin(), words.end(),
            [](const std::string& a, const std::string& b) {
              if (a.size() != b.size()) return a.size() > b.size();
              return a < b;
            });

  std::ostringstream ss;
  ss << "(?:";
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) ss << "|";
    for (char c : words[i]) {
      if (std::strchr(R"(\^$.|?*+()[]{})", c) != nullptr) {
        ss << '\\';
      }
      ss << c;
    }
  }
  ss << ")";
  return ss.str();
}

}  // namespace shield
