#pragma once
#include "problem.h"
#include <random>
#include <vector>

// Random preference lists over 1..nOther: a random subset in random order,
// optionally cut short by a 0 ("prefer unmatched") entry.
auto randomPrefs(std::mt19937 &rng, int nOther, bool withSentinel)
  -> std::vector<int>;

// A side of n members ranking nOther members, capacities drawn from
// [minCap, maxCap].
auto randomSide(std::mt19937 &rng, int n, int nOther, int minCap, int maxCap,
                bool withSentinel = true) -> Side;

// Sum of the lengths of every preference list of a side.
auto totalPrefLength(const Side &side) -> int;
