/***********[rankindex.h]
Copyright (c) 2014, Fahiem Bacchus

Permission is hereby granted, free of charge, to any person obtaining a
copy of this software and associated documentation files (the
"Software"), to deal in the Software without restriction, including
without limitation the rights to use, copy, modify, merge, publish,
distribute, sublicense, and/or sell copies of the Software, and to
permit persons to whom the Software is furnished to do so, subject to
the following conditions:

The above copyright notice and this permission notice shall be included
in all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

***********/

#ifndef RANKINDEX_H
#define RANKINDEX_H

#include <vector>
#include "problem.h"

//Constant time rank lookup for one member's preference list.
//Ranks are 1-based. The "prefer unmatched" entry has the rank of its
//position in the list, or one past the end when the list has none.
//Candidates that are not listed rank below everything.
class PrefRanks {
public:
  PrefRanks() : ranks {}, unmatchedRank {1} {}
  PrefRanks(const std::vector<MID>& rol, int nCandidates);

  int rankOf(MID c) const {
    if(c.isNil())
      return unmatchedRank;
    return ranks[c];
  }
  bool prefers(MID c1, MID c2) const { return rankOf(c1) < rankOf(c2); }
  bool acceptable(MID c) const { return rankOf(c) < unmatchedRank; }
  int UNMATCHED() const { return unmatchedRank; }

private:
  std::vector<int> ranks;
  int unmatchedRank;
};

//Rank indices for every member of a side.
std::vector<PrefRanks> rankSide(const Side& side);

#endif
