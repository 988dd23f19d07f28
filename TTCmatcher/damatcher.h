/***********[damatcher.h]
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

#ifndef DAMATCHER_H
#define DAMATCHER_H

#include <vector>
#include "matcher.h"
#include "rankindex.h"

//Gale-Shapley deferred acceptance with the agents proposing to the
//objects. Objects hold up to their capacity of proposers, displacing the
//worst held one when a better proposer arrives. Every agent capacity must
//be 0 or 1.
class DAmatcher : public Matcher {
public:
  DAmatcher() : nRounds {0}, nProposals {0}, nRejections {0}, nDisplaced {0} {}

  Matching match(const Problem& prob) override;
  Matching run(const Side& proposers, const Side& respondents);

  const char* name() const override { return "DA"; }
  void printStats() const override;

  int rounds() const { return nRounds; }
  int proposals() const { return nProposals; }
  int rejections() const { return nRejections; }

private:
  int nRounds;
  int nProposals;
  int nRejections;
  int nDisplaced;

  //worst (highest rank) proposer currently held by a respondent
  static size_t worstHeld(const std::vector<MID>& held, const PrefRanks& ranks);
};

#endif
