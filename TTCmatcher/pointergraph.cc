/***********[pointergraph.cc]
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

#include <algorithm>
#include "pointergraph.h"

using std::vector;

int PointerGraph::nEdges() const {
  return static_cast<int>(std::count_if(next.begin(), next.end(), [](int s) { return s >= 0; }));
}

void PointerGraph::clear() {
  std::fill(next.begin(), next.end(), -1);
}

vector<Cycle> PointerGraph::cycles() const {
  //0 = unvisited, 1 = on the path being followed, 2 = finished
  vector<char> state(nNodes(), 0);
  vector<int> pathPos(nNodes(), -1);
  vector<Cycle> found;
  vector<int> path;

  for(int s = 0; s < nNodes(); s++) {
    if(state[s] != 0)
      continue;
    path.clear();
    int v = s;
    while(v >= 0 && state[v] == 0) {
      state[v] = 1;
      pathPos[v] = static_cast<int>(path.size());
      path.push_back(v);
      v = next[v];
    }
    if(v >= 0 && state[v] == 1) {
      Cycle c(path.begin() + pathPos[v], path.end());
      auto first = std::min_element(c.begin(), c.end());
      if(isAgent(*first))
        std::rotate(c.begin(), first, c.end());
      found.push_back(c);
    }
    for(auto u : path)
      state[u] = 2;
  }
  std::sort(found.begin(), found.end(),
            [](const Cycle& c1, const Cycle& c2) { return c1.front() < c2.front(); });
  return found;
}

vector<MIDPair> PointerGraph::pairs(const Cycle& c) const {
  vector<MIDPair> out;
  for(size_t i = 0; i + 1 < c.size(); i += 2)
    out.push_back({memberOf(c[i]), memberOf(c[i+1])});
  return out;
}

std::ostream& operator<<(std::ostream& os, const Cycle& c) {
  os << "(";
  for(size_t i = 0; i < c.size(); i++)
    os << (i ? " " : "") << c[i];
  os << ")";
  return os;
}
