/***********[ttcmatcher.h]
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

#ifndef TTCMATCHER_H
#define TTCMATCHER_H

#include <vector>
#include "matcher.h"
#include "pointergraph.h"

//Object-side acceptance of agents: acc[a][o] iff object o lists agent a
//ahead of its "prefer unmatched" entry.
typedef std::vector<std::vector<bool>> Acceptability;

Acceptability acceptabilityOf(const Side& objects, int nAgents);

//Mutable state of a TTC run, threaded from round to round. Preference
//indices only move forward and vacancies only go down.
struct RoundState {
  RoundState(const Side& agents, const Side& objects);

  std::vector<int> agentVacant;
  std::vector<int> objectVacant;
  std::vector<size_t> nextObjectRank; //index into each agent's list
  std::vector<size_t> nextAgentRank;  //index into each object's list
  std::vector<MID> nextObject;        //current target, nilMID = self
  std::vector<MID> nextAgent;
  int agentsRemaining;
  int objectsRemaining;

  bool agentActive(MID a) const { return agentVacant[a] > 0; }
  bool objectActive(MID o) const { return objectVacant[o] > 0; }
  void retireAgent(MID a);
  void retireObject(MID o);
  //one slot on each side is used up
  void fill(MID a, MID o);
};

//Top trading cycles for a two-sided market (e.g. school choice). The
//result is Pareto efficient for whichever side plays the agent role.
class TTCmatcher : public Matcher {
public:
  explicit TTCmatcher(bool inverse = false) :
    inv {inverse}, nRounds {0}, nCycles {0}, nPairings {0}, traded {} {}

  Matching match(const Problem& prob) override;
  //Agents x objects matching. With inverse set the objects are the
  //trading agents; the result is still indexed agents x objects.
  Matching run(const Side& agents, const Side& objects);

  const char* name() const override { return "TTC"; }
  void printStats() const override;

  int rounds() const { return nRounds; }
  int cycles() const { return nCycles; }
  int pairings() const { return nPairings; }
  //Every cycle committed by the last run, in commit order. Nodes are those
  //of the trading graph: with inverse set its agent nodes are the objects.
  const std::vector<Cycle>& tradedCycles() const { return traded; }

protected:
  bool inv;
  int nRounds;
  int nCycles;
  int nPairings;
  std::vector<Cycle> traded;

  //Move agent a's pointer to its best object that still has a vacancy
  //(and, when acc is given, accepts a). Retires a when its list runs
  //out or reaches "prefer unmatched".
  MID advanceAgent(RoundState& st, const Side& agents, MID a, const Acceptability* acc) const;
  MID advanceObject(RoundState& st, const Side& objects, MID o) const;
  void pointAgents(RoundState& st, const Side& agents, const Acceptability* acc,
                   PointerGraph& graph) const;

private:
  Matching trade(const Side& agents, const Side& objects);
};

#endif
