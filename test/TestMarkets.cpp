#include "TestMarkets.hpp"
#include <algorithm>

auto randomPrefs(std::mt19937 &rng, int nOther, bool withSentinel)
  -> std::vector<int> {
  std::vector<int> ids;
  for (int i = 1; i <= nOther; ++i) ids.push_back(i);
  std::shuffle(ids.begin(), ids.end(), rng);
  std::uniform_int_distribution<int> len(0, nOther);
  ids.resize(len(rng));
  if (withSentinel && std::uniform_int_distribution<int>(0, 2)(rng) == 0) {
    std::uniform_int_distribution<int> at(0, int(ids.size()));
    ids.insert(ids.begin() + at(rng), 0);
  }
  return ids;
}

auto randomSide(std::mt19937 &rng, int n, int nOther, int minCap, int maxCap,
                bool withSentinel) -> Side {
  std::vector<int> caps;
  std::vector<std::vector<int>> prefs;
  std::uniform_int_distribution<int> cap(minCap, maxCap);
  for (int i = 0; i < n; ++i) {
    caps.push_back(cap(rng));
    prefs.push_back(randomPrefs(rng, nOther, withSentinel));
  }
  return Side{caps, prefs, nOther};
}

auto totalPrefLength(const Side &side) -> int {
  int total = 0;
  for (int i = 0; i < side.size(); ++i) total += side.prefLen(i);
  return total;
}
