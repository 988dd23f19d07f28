/***********[ttcmatcher.cc]
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
#include "ttcmatcher.h"
#include "params.h"

using std::vector;
using std::cout;

Acceptability acceptabilityOf(const Side& objects, int nAgents) {
  Acceptability acc(nAgents, vector<bool>(objects.size(), false));
  for(int o = 0; o < objects.size(); o++)
    for(auto a : objects.ROL(o)) {
      if(a.isNil())
        break;
      acc[a][o] = true;
    }
  return acc;
}

RoundState::RoundState(const Side& agents, const Side& objects) :
  agentVacant(agents.CAPS()),
  objectVacant(objects.CAPS()),
  nextObjectRank(agents.size(), 0),
  nextAgentRank(objects.size(), 0),
  nextObject(agents.size(), nilMID),
  nextAgent(objects.size(), nilMID),
  agentsRemaining {0},
  objectsRemaining {0}
{
  for(auto v : agentVacant)
    if(v > 0)
      ++agentsRemaining;
  for(auto v : objectVacant)
    if(v > 0)
      ++objectsRemaining;
}

void RoundState::retireAgent(MID a) {
  nextObject[a] = nilMID;
  agentVacant[a] = 0;
  --agentsRemaining;
}

void RoundState::retireObject(MID o) {
  nextAgent[o] = nilMID;
  objectVacant[o] = 0;
  --objectsRemaining;
}

void RoundState::fill(MID a, MID o) {
  if(--agentVacant[a] == 0)
    --agentsRemaining;
  if(--objectVacant[o] == 0)
    --objectsRemaining;
}

MID TTCmatcher::advanceAgent(RoundState& st, const Side& agents, MID a,
                             const Acceptability* acc) const {
  const auto& rol = agents.ROL(a);
  while(true) {
    if(st.nextObjectRank[a] >= rol.size()) {
      st.retireAgent(a);
      return nilMID;
    }
    MID o = rol[st.nextObjectRank[a]];
    if(o.isNil()) {
      st.retireAgent(a);
      return nilMID;
    }
    if(st.objectActive(o) && (!acc || (*acc)[a][o])) {
      st.nextObject[a] = o;
      return o;
    }
    st.nextObjectRank[a]++;
  }
}

MID TTCmatcher::advanceObject(RoundState& st, const Side& objects, MID o) const {
  const auto& rol = objects.ROL(o);
  while(true) {
    if(st.nextAgentRank[o] >= rol.size()) {
      st.retireObject(o);
      return nilMID;
    }
    MID a = rol[st.nextAgentRank[o]];
    if(a.isNil()) {
      st.retireObject(o);
      return nilMID;
    }
    if(st.agentActive(a)) {
      st.nextAgent[o] = a;
      return a;
    }
    st.nextAgentRank[o]++;
  }
}

void TTCmatcher::pointAgents(RoundState& st, const Side& agents, const Acceptability* acc,
                             PointerGraph& graph) const {
  for(int a = 0; a < agents.size(); a++) {
    if(!st.agentActive(a))
      continue;
    MID o = advanceAgent(st, agents, a, acc);
    if(!o.isNil())
      graph.point(graph.agentNode(a), graph.objectNode(o));
  }
}

Matching TTCmatcher::match(const Problem& prob) {
  return run(prob.agents(), prob.objects());
}

Matching TTCmatcher::run(const Side& agents, const Side& objects) {
  checkSides(agents, objects);
  nRounds = nCycles = nPairings = 0;
  traded.clear();
  if(inv)
    return trade(objects, agents).transposed();
  return trade(agents, objects);
}

Matching TTCmatcher::trade(const Side& agents, const Side& objects) {
  auto acc = acceptabilityOf(objects, agents.size());
  RoundState st {agents, objects};
  PointerGraph graph {agents.size(), objects.size()};
  Matching matching {agents.size(), objects.size()};

  while(st.agentsRemaining > 0 && st.objectsRemaining > 0) {
    ++nRounds;
    graph.clear();
    pointAgents(st, agents, &acc, graph);
    for(int o = 0; o < objects.size(); o++) {
      if(!st.objectActive(o))
        continue;
      MID a = advanceObject(st, objects, o);
      if(!a.isNil())
        graph.point(graph.objectNode(o), graph.agentNode(a));
    }

    auto cycles = graph.cycles();
    for(const auto& c : cycles) {
      if(params.verbosity > 2)
        cout << "#TTC round " << nRounds << " cycle " << c << "\n";
      for(const auto& p : graph.pairs(c)) {
        MID a = p.first;
        MID o = p.second;
        matching.add(a, o);
        st.nextObjectRank[a]++;
        st.nextAgentRank[o]++;
        st.fill(a, o);
        ++nPairings;
      }
      traded.push_back(c);
    }
    nCycles += static_cast<int>(cycles.size());
    if(params.verbosity > 1)
      cout << "#TTC round " << nRounds << ": " << cycles.size() << " cycles, "
           << st.agentsRemaining << " agents and " << st.objectsRemaining
           << " objects remaining\n";
  }

  if(params.verbosity > 0)
    cout << "#TTC done after " << nRounds << " rounds, " << matching.nPairs() << " pairs\n";
  return matching;
}

void TTCmatcher::printStats() const {
  cout << "#" << name() << " Stats:\n";
  cout << "#Rounds: " << nRounds << "\n";
  cout << "#Cycles: " << nCycles << "\n";
  cout << "#Pairings: " << nPairings << "\n";
}
