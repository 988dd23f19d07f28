/***********[httcmatcher.cc]
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
#include "httcmatcher.h"
#include "errors.h"
#include "params.h"

using std::vector;
using std::cout;

Matching HTTCmatcher::match(const Problem& prob) {
  const auto& agents = prob.agents();
  Priority priority = prob.hasPriority() ? prob.priority() : Priority::identity(agents.size());
  if(prob.hasOwnership())
    return run(agents, prob.objects(), priority, prob.ownership());
  return run(agents, prob.objects(), priority);
}

Matching HTTCmatcher::run(const Side& agents, const Side& objects, const Priority& priority) {
  return run(agents, objects, priority, Ownership {agents.size(), objects.size()});
}

void HTTCmatcher::transfer(MID agent, MID object) {
  MID prev = possessions[agent];
  if(!prev.isNil() && owners[prev] == agent)
    owners[prev] = nilMID;
  possessions[agent] = object;
  owners[object] = agent;
  ++nTransfers;
}

Matching HTTCmatcher::run(const Side& agents, const Side& objects, const Priority& priority,
                          const Ownership& ownership) {
  checkSides(agents, objects);
  if(!agents.allCapsOne() || !objects.allCapsOne())
    throw ConfigurationError("housing TTC needs every agent and object capacity to be 1");
  ownership.validate(agents.size(), objects.size());
  priority.validate(agents.size());

  nRounds = nCycles = nPairings = nTransfers = 0;
  traded.clear();
  possessions.assign(agents.size(), nilMID);
  owners.assign(objects.size(), nilMID);
  for(const auto& w : ownership.OWNED()) {
    possessions[w.first] = w.second;
    owners[w.second] = w.first;
  }

  RoundState st {agents, objects};
  PointerGraph graph {agents.size(), objects.size()};

  for(auto prior : priority.order()) {
    ++nRounds;
    graph.clear();
    pointAgents(st, agents, nullptr, graph);
    for(int o = 0; o < objects.size(); o++) {
      if(!st.objectActive(o))
        continue;
      MID owner = owners[o];
      graph.point(graph.objectNode(o), graph.agentNode(owner.isNil() ? prior : owner));
    }

    auto cycles = graph.cycles();
    for(const auto& c : cycles) {
      if(params.verbosity > 2)
        cout << "#Housing TTC step " << nRounds << " (agent " << prior << ") cycle " << c << "\n";
      for(const auto& p : graph.pairs(c)) {
        transfer(p.first, p.second);
        st.fill(p.first, p.second);
        ++nPairings;
      }
      traded.push_back(c);
    }
    nCycles += static_cast<int>(cycles.size());
    if(params.verbosity > 1)
      cout << "#Housing TTC step " << nRounds << " (agent " << prior << "): "
           << cycles.size() << " cycles\n";
  }

  Matching matching {agents.size(), objects.size()};
  for(int a = 0; a < agents.size(); a++)
    if(!possessions[a].isNil())
      matching.add(a, possessions[a]);

  if(params.verbosity > 0)
    cout << "#Housing TTC done after " << nRounds << " steps, " << matching.nPairs() << " pairs\n";
  return matching;
}

void HTTCmatcher::printStats() const {
  TTCmatcher::printStats();
  cout << "#Transfers: " << nTransfers << "\n";
}
