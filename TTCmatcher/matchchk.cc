/***********[matchchk.cc]
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

#include <fstream>
#include <sstream>
#include "matchchk.h"

using std::vector;
using std::string;
using std::ostream;
using std::istringstream;
using std::ostringstream;

MatchChk::MatchChk(const Problem* p) :
  prob {p},
  match {p->agents().size(), p->objects().size()},
  agentRanks(rankSide(p->agents())),
  objectRanks(rankSide(p->objects())),
  errMsg {},
  checkOK {true},
  nomatch {true}
{}

bool MatchChk::readMatch(string filename) {
  std::ifstream in {filename};
  if(!in) {
    postError("Input ERROR: could not open \"" + filename + "\"\n");
    return ok();
  }
  return readMatch(in);
}

bool MatchChk::readMatch(std::istream& in) {
  vector<string> ilines;
  string line;
  while(getline(in, line))
    ilines.push_back(line);
  for(auto l : ilines) {
    if(l.size() == 0)
      continue;
    switch( l[0] ) {
    case ' ':
      break;
    case '#':
      break;
    case 'a':
      readAgent(l);
      break;
    case 'm':
      readValid(l);
      break;
    default:
      postError("Input ERROR: line \"" + l + "\" from input is invalid\n");
    }
  }
  return ok();
}

void MatchChk::readAgent(string l) {
  //Format:
  //"a <agent id> <object id>"
  //Where agent "aid" is matched to object "oid" (0 = unmatched). Agents
  //with capacity above 1 have one line per object.
  istringstream iss {l};
  char c;
  int a, o;

  if(!(iss >> c >> a >> o)) {
    postError("Input ERROR: malformed match line \"" + l + "\"\n");
    return;
  }
  if(a < 1 || a > match.numAgents() || o < 0 || o > match.numObjects()) {
    postError("Input ERROR: match line \"" + l + "\" names unknown agent or object.\n");
    return;
  }
  if(o != 0)
    match.add(MID::fromExt(a), MID::fromExt(o));
}

void MatchChk::readValid(string l) {
  //Format:
  //"m [0/1]"
  //0 indicates that no match was found. 1 a match that has to be checked.
  istringstream iss {l};
  char c;
  int m {0};
  iss >> c >> m;
  nomatch = m != 1;
}

bool MatchChk::wouldAccept(MID o, MID a) const {
  const auto& ranks = objectRanks[o];
  if(!ranks.acceptable(a))
    return false;
  const auto& held = match.agentsOf(o);
  if(static_cast<int>(held.size()) < prob->objects().cap(o))
    return true;
  for(auto h : held)
    if(ranks.prefers(a, h))
      return true;
  return false;
}

bool MatchChk::checkCapacities() {
  bool good {true};
  for(int a = 0; a < match.numAgents(); a++) {
    int n = static_cast<int>(match.objectsOf(a).size());
    if(n > prob->agents().cap(a)) {
      ostringstream oss {};
      oss << "ERROR: Agent " << MID {a} << " holds " << n << " objects, capacity "
          << prob->agents().cap(a) << "\n";
      postError(oss.str());
      good = false;
    }
  }
  for(int o = 0; o < match.numObjects(); o++) {
    int n = static_cast<int>(match.agentsOf(o).size());
    if(n > prob->objects().cap(o)) {
      ostringstream oss {};
      oss << "ERROR: Object " << MID {o} << " holds " << n << " agents, capacity "
          << prob->objects().cap(o) << "\n";
      postError(oss.str());
      good = false;
    }
  }
  return good;
}

bool MatchChk::checkAgentAcceptable() {
  bool good {true};
  for(int a = 0; a < match.numAgents(); a++)
    for(auto o : match.objectsOf(a)) {
      //a tenant may always keep its own house
      if(prob->hasOwnership() && prob->ownership().ownerOf(o) == MID {a})
        continue;
      if(!agentRanks[a].acceptable(o)) {
        ostringstream oss {};
        oss << "ERROR: Agent " << MID {a} << "= " << o << ". Agent does not rank object\n";
        postError(oss.str());
        good = false;
      }
    }
  return good;
}

bool MatchChk::checkAcceptable() {
  bool good {checkAgentAcceptable()};
  for(int a = 0; a < match.numAgents(); a++)
    for(auto o : match.objectsOf(a))
      if(!objectRanks[o].acceptable(a)) {
        ostringstream oss {};
        oss << "ERROR: Agent " << MID {a} << "= " << o << ". Object does not rank agent\n";
        postError(oss.str());
        good = false;
      }
  return good;
}

bool MatchChk::checkStable() {
  bool good {true};
  for(int a = 0; a < match.numAgents(); a++) {
    if(prob->agents().cap(a) == 0)
      continue;
    MID cur = match.objectOf(a);
    for(auto o : prob->agents().ROL(a)) {
      if(o == cur || o.isNil())
        break;
      if(wouldAccept(o, a)) {
        ostringstream oss {};
        oss << "ERROR: Agent " << MID {a} << "= " << cur
            << ". Agent and higher ranked object " << o << " block the match\n";
        postError(oss.str());
        good = false;
      }
    }
  }
  return good;
}

bool MatchChk::checkIndividuallyRational() {
  if(!prob->hasOwnership())
    return true;
  bool good {true};
  for(const auto& w : prob->ownership().OWNED()) {
    MID a = w.first;
    MID endowment = w.second;
    MID got = match.objectOf(a);
    if(got == endowment)
      continue;
    if(got.isNil() || !agentRanks[a].prefers(got, endowment)) {
      ostringstream oss {};
      oss << "ERROR: Agent " << a << "= " << got
          << ". Agent prefers its endowment " << endowment << "\n";
      postError(oss.str());
      good = false;
    }
  }
  return good;
}

bool MatchChk::check(int algo) {
  if(nomatch)
    return true;
  checkCapacities();
  switch(algo) {
  case 0:
    checkAcceptable();
    checkStable();
    break;
  case 1:
    checkAcceptable();
    break;
  default:
    checkAgentAcceptable();
    checkIndividuallyRational();
  }
  return checkOK;
}

void MatchChk::printMatchStats(ostream& os) const {
  int agNotMatched {0};
  int objSpareCap {0};
  int agGotTopRank {0};
  double agAveRank {0};
  int nPairs {0};

  for(int a = 0; a < match.numAgents(); a++) {
    const auto& objs = match.objectsOf(a);
    if(objs.empty())
      ++agNotMatched;
    for(auto o : objs) {
      agAveRank += agentRanks[a].rankOf(o);
      ++nPairs;
      if(agentRanks[a].rankOf(o) == 1)
        ++agGotTopRank;
    }
  }
  for(int o = 0; o < match.numObjects(); o++)
    objSpareCap += prob->objects().cap(o) - static_cast<int>(match.agentsOf(o).size());

  os << "#Matching Summary Stats:\n";
  os << "#Unmatched Agents: " << agNotMatched << "\n";
  os << "#Unmatched Object slots: " << objSpareCap << "\n";
  if(nPairs > 0)
    os << "#Ave Agent Rank of their objects = " << agAveRank/nPairs << "\n";
  os << "#Num Agents getting their top rank = " << agGotTopRank << "\n";
}

ostream& operator<<(ostream& os, const MatchChk& chk) {
  os << "Match Spec:\n";
  for(int a = 0; a < chk.match.numAgents(); a++) {
    os << "Agent " << MID {a} << ". match =";
    for(auto o : chk.match.objectsOf(a))
      os << " " << o;
    os << "\n";
  }
  return os;
}
