/***********[pointergraph.h]
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

#ifndef POINTERGRAPH_H
#define POINTERGRAPH_H

#include <vector>
#include "problem.h"

typedef std::vector<int> Cycle;

//Who-points-at-whom graph of one TTC round. Nodes 0..nAgents-1 are the
//agents, nAgents..nAgents+nObjects-1 the objects. Every node has at most
//one outgoing edge, so the graph is functional and its cycles are
//vertex-disjoint.
class PointerGraph {
public:
  PointerGraph(int nAgents, int nObjects) :
    nAg {nAgents}, nObj {nObjects}, next(nAgents + nObjects, -1) {}

  int agentNode(MID a) const { return a.id; }
  int objectNode(MID o) const { return nAg + o.id; }
  bool isAgent(int node) const { return node < nAg; }
  MID memberOf(int node) const { return isAgent(node) ? MID {node} : MID {node - nAg}; }

  int nNodes() const { return nAg + nObj; }
  int succ(int node) const { return next[node]; }
  int nEdges() const;

  void clear();
  void point(int from, int to) { next[from] = to; }

  //All cycles, each rotated to start at its lowest agent node, ordered by
  //that node. Linear in the number of nodes.
  std::vector<Cycle> cycles() const;

  //(agent, object) pairing encoded by a cycle: each agent gets the object
  //it points at.
  std::vector<MIDPair> pairs(const Cycle& c) const;

private:
  int nAg;
  int nObj;
  std::vector<int> next;
};

std::ostream& operator<<(std::ostream& os, const Cycle& c);

#endif
