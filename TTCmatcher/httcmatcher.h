/***********[httcmatcher.h]
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

#ifndef HTTCMATCHER_H
#define HTTCMATCHER_H

#include <vector>
#include "ttcmatcher.h"

//Top trading cycles for a one-sided housing market, with or without
//existing tenants. Agents are processed in priority order: during the step
//of agent p every unowned object points at p and every owned object at its
//owner, and all cycles of the resulting graph trade at once. Every agent
//and object capacity must be exactly 1.
class HTTCmatcher : public TTCmatcher {
public:
  HTTCmatcher() : TTCmatcher {false}, nTransfers {0}, possessions {}, owners {} {}

  Matching match(const Problem& prob) override;
  Matching run(const Side& agents, const Side& objects, const Priority& priority,
               const Ownership& ownership);
  //No existing tenants: every object starts unowned.
  Matching run(const Side& agents, const Side& objects, const Priority& priority);

  const char* name() const override { return "Housing TTC"; }
  void printStats() const override;

  int steps() const { return nRounds; }
  int transfers() const { return nTransfers; }

  //Ownership after the last run: possession per agent, owner per object.
  const std::vector<MID>& POSSESSIONS() const { return possessions; }
  const std::vector<MID>& OWNERS() const { return owners; }

private:
  int nTransfers;
  std::vector<MID> possessions;
  std::vector<MID> owners;

  void transfer(MID agent, MID object);
};

#endif
