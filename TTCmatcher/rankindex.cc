/***********[rankindex.cc]
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

#include <limits>
#include "rankindex.h"

using std::vector;

PrefRanks::PrefRanks(const vector<MID>& rol, int nCandidates) :
  ranks(nCandidates, std::numeric_limits<int>::max()),
  unmatchedRank {static_cast<int>(rol.size()) + 1}
{
  bool sawNil {false};
  for(size_t i = 0; i < rol.size(); i++) {
    int rank = static_cast<int>(i) + 1;
    if(rol[i].isNil()) {
      if(!sawNil) {
        unmatchedRank = rank;
        sawNil = true;
      }
    }
    else
      ranks[rol[i]] = rank;
  }
}

vector<PrefRanks> rankSide(const Side& side) {
  vector<PrefRanks> out;
  out.reserve(side.size());
  for(int i = 0; i < side.size(); i++)
    out.push_back(PrefRanks(side.ROL(i), side.otherSize()));
  return out;
}
