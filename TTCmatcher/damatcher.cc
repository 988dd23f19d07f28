/***********[damatcher.cc]
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

#include <iostream>
#include <sstream>
#include "damatcher.h"
#include "errors.h"
#include "params.h"

using std::vector;
using std::cout;

Matching DAmatcher::match(const Problem& prob) {
  return run(prob.agents(), prob.objects());
}

size_t DAmatcher::worstHeld(const vector<MID>& held, const PrefRanks& ranks) {
  size_t w {0};
  for(size_t i = 1; i < held.size(); i++)
    if(ranks.prefers(held[w], held[i]))
      w = i;
  return w;
}

Matching DAmatcher::run(const Side& proposers, const Side& respondents) {
  checkSides(proposers, respondents);
  for(int p = 0; p < proposers.size(); p++)
    if(proposers.cap(p) > 1) {
      std::ostringstream oss {};
      oss << "deferred acceptance needs proposer capacities of at most 1, proposer "
          << MID {p} << " has " << proposers.cap(p);
      throw ConfigurationError(oss.str());
    }

  nRounds = nProposals = nRejections = nDisplaced = 0;
  int nProps = proposers.size();
  int nResps = respondents.size();
  auto respRanks = rankSide(respondents);

  vector<bool> isSingle(nProps);
  int nSingle {0};
  for(int p = 0; p < nProps; p++) {
    isSingle[p] = proposers.cap(p) > 0;
    if(isSingle[p])
      ++nSingle;
  }
  //index of the next respondent to propose to; never decreases
  vector<size_t> nextResp(nProps, 0);
  vector<vector<MID>> held(nResps);

  while(nSingle > 0) {
    ++nRounds;
    for(int p = 0; p < nProps; p++) {
      if(!isSingle[p])
        continue;
      const auto& rol = proposers.ROL(p);
      //end of list is an implicit "prefer unmatched"
      MID r = nextResp[p] < rol.size() ? rol[nextResp[p]] : nilMID;
      nextResp[p]++;

      if(r.isNil()) {
        isSingle[p] = false;
        --nSingle;
        if(params.verbosity > 2)
          cout << "#DA proposer " << MID {p} << " stays unmatched\n";
        continue;
      }
      ++nProposals;
      const auto& ranks = respRanks[r];
      auto& h = held[r];

      if(!ranks.acceptable(p)) {
        ++nRejections;
      }
      else if(static_cast<int>(h.size()) < respondents.cap(r)) {
        h.push_back(p);
        isSingle[p] = false;
        --nSingle;
      }
      else if(!h.empty()) {
        auto w = worstHeld(h, ranks);
        if(ranks.prefers(p, h[w])) {
          MID bumped = h[w];
          h[w] = p;
          isSingle[p] = false;
          isSingle[bumped] = true;
          ++nDisplaced;
          if(params.verbosity > 2)
            cout << "#DA object " << r << " takes " << MID {p} << " over " << bumped << "\n";
        }
        else
          ++nRejections;
      }
      else
        ++nRejections; //no seats at all
    }
    if(params.verbosity > 1)
      cout << "#DA round " << nRounds << ": " << nSingle << " single proposers left\n";
  }

  Matching matching {nProps, nResps};
  for(int r = 0; r < nResps; r++)
    for(auto p : held[r])
      matching.add(p, r);

  if(params.verbosity > 0)
    cout << "#DA done after " << nRounds << " rounds, " << matching.nPairs() << " pairs\n";
  return matching;
}

void DAmatcher::printStats() const {
  cout << "#DA Stats:\n";
  cout << "#Rounds: " << nRounds << "\n";
  cout << "#Proposals: " << nProposals << "\n";
  cout << "#Rejections: " << nRejections << "\n";
  cout << "#Displaced proposers: " << nDisplaced << "\n";
}
