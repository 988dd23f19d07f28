/***********[problem.cc]
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
#include <fstream>
#include <sstream>
#include "problem.h"
#include "errors.h"

using std::vector;
using std::string;
using std::unordered_set;
using std::ostream;
using std::istringstream;
using std::ostringstream;

ostream& operator<<(ostream& os, const MID& m) {
  os << m.ext();
  return os;
}

Side::Side(const vector<int>& capacities, const vector<vector<int>>& prefs,
           int otherSideSize) :
  caps(capacities),
  rol {},
  nOther {otherSideSize}
{
  if(capacities.size() != prefs.size()) {
    ostringstream oss {};
    oss << "side has " << capacities.size() << " capacities but "
        << prefs.size() << " preference lists";
    throw DimensionMismatchError(oss.str());
  }
  rol.resize(prefs.size());
  for(size_t i = 0; i < prefs.size(); i++) {
    if(caps[i] < 0) {
      ostringstream oss {};
      oss << "member " << i+1 << " has negative capacity " << caps[i];
      throw ConfigurationError(oss.str());
    }
    vector<bool> seen(nOther, false);
    for(auto e : prefs[i]) {
      if(e < 0 || e > nOther) {
        ostringstream oss {};
        oss << "member " << i+1 << " ranks " << e
            << " but the other side has " << nOther << " members";
        throw DimensionMismatchError(oss.str());
      }
      if(e > 0) {
        if(seen[e-1]) {
          ostringstream oss {};
          oss << "member " << i+1 << " ranks " << e << " twice";
          throw ConfigurationError(oss.str());
        }
        seen[e-1] = true;
      }
      rol[i].push_back(MID::fromExt(e));
    }
  }
}

bool Side::accepts(MID i, MID j) const {
  for(auto m : rol[i]) {
    if(m.isNil())
      return false;
    if(m == j)
      return true;
  }
  return false;
}

bool Side::allCapsOne() const {
  return std::all_of(caps.begin(), caps.end(), [](int c) { return c == 1; });
}

Priority::Priority(const vector<int>& agentIds) : ord {} {
  for(auto a : agentIds)
    ord.push_back(MID::fromExt(a));
}

Priority Priority::identity(int nAgents) {
  vector<int> ids;
  for(int a = 1; a <= nAgents; a++)
    ids.push_back(a);
  return Priority(ids);
}

void Priority::validate(int nAgents) const {
  if(size() != nAgents) {
    ostringstream oss {};
    oss << "priority lists " << size() << " agents, market has " << nAgents;
    throw DimensionMismatchError(oss.str());
  }
  vector<bool> seen(nAgents, false);
  for(auto a : ord) {
    if(a.isNil() || a.id >= nAgents) {
      ostringstream oss {};
      oss << "priority names agent " << a << " outside 1.." << nAgents;
      throw ConfigurationError(oss.str());
    }
    if(seen[a]) {
      ostringstream oss {};
      oss << "priority names agent " << a << " more than once";
      throw ConfigurationError(oss.str());
    }
    seen[a] = true;
  }
}

void Ownership::own(int agent, int object) {
  if(agent < 1 || agent > nAg || object < 1 || object > nObj) {
    ostringstream oss {};
    oss << "ownership (" << agent << ", " << object << ") outside a "
        << nAg << " x " << nObj << " relation";
    throw DimensionMismatchError(oss.str());
  }
  owned.push_back({MID::fromExt(agent), MID::fromExt(object)});
}

void Ownership::validate(int nAgents, int nObjects) const {
  if(nAg != nAgents) {
    ostringstream oss {};
    oss << "ownership declares " << nAg << " agents, market has " << nAgents;
    throw DimensionMismatchError(oss.str());
  }
  if(nObj != nObjects) {
    ostringstream oss {};
    oss << "ownership declares " << nObj << " objects, market has " << nObjects;
    throw DimensionMismatchError(oss.str());
  }
  vector<int> owners(nObj, 0);
  vector<int> possessions(nAg, 0);
  for(const auto& w : owned) {
    if(++owners[w.second] > 1) {
      ostringstream oss {};
      oss << "object " << w.second << " has more than one owner";
      throw OwnershipIntegrityError(oss.str());
    }
    if(++possessions[w.first] > 1) {
      ostringstream oss {};
      oss << "agent " << w.first << " owns more than one object";
      throw OwnershipIntegrityError(oss.str());
    }
  }
}

MID Ownership::ownerOf(MID object) const {
  for(const auto& w : owned)
    if(w.second == object)
      return w.first;
  return nilMID;
}

Matching::Matching(int nAgents, int nObjects) :
  nAg {nAgents},
  nObj {nObjects},
  rel(static_cast<size_t>(nAgents) * nObjects, false),
  byAgent(nAgents),
  byObject(nObjects),
  npairs {0}
{}

void Matching::add(MID agent, MID object) {
  auto idx = static_cast<size_t>(object) * nAg + agent;
  if(rel[idx])
    return;
  rel[idx] = true;
  byAgent[agent].push_back(object);
  byObject[object].push_back(agent);
  ++npairs;
}

bool Matching::has(MID agent, MID object) const {
  return rel[static_cast<size_t>(object) * nAg + agent];
}

MID Matching::objectOf(MID agent) const {
  return byAgent[agent].empty() ? nilMID : byAgent[agent].front();
}

Matching Matching::transposed() const {
  Matching t {nObj, nAg};
  for(int a = 0; a < nAg; a++)
    for(auto o : byAgent[a])
      t.add(o, a);
  return t;
}

bool Matching::operator==(const Matching& o) const {
  return nAg == o.nAg && nObj == o.nObj && rel == o.rel;
}

ostream& operator<<(ostream& os, const Matching& m) {
  //object x agent relation, one row per object
  for(int o = 0; o < m.numObjects(); o++) {
    for(int a = 0; a < m.numAgents(); a++)
      os << (m.has(a, o) ? '1' : '0');
    os << "\n";
  }
  return os;
}

Problem::Problem(const Side& agents, const Side& objects) : Problem {} {
  ag = agents;
  obj = objects;
}

bool Problem::readProblem(string filename) {
  std::ifstream in {filename};
  if(!in) {
    postError("Input ERROR: could not open \"" + filename + "\"\n");
    return ok();
  }
  return readProblem(in);
}

bool Problem::readProblem(std::istream& in) {
  vector<string> ilines;
  string line;
  while(getline(in, line))
    ilines.push_back(line);
  idBound = static_cast<int>(ilines.size());
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
    case 'o':
      readObject(l);
      break;
    case 'p':
      readPriority(l);
      break;
    case 'w':
      readOwner(l);
      break;
    default:
      postError("Input ERROR: line \"" + l + "\" from input is invalid\n");
    }
  }
  postProcess();
  return ok();
}

bool Problem::chkID(int id, unordered_set<int>& Ids, string errmsg) {
  auto fnd = Ids.find(id);
  if(fnd != Ids.end()) {
    postError(errmsg);
    return false;
  }
  else {
    Ids.insert(id);
    return true;
  }
}

bool Problem::chkBound(int id, const char* what) {
  if(id <= idBound)
    return true;
  ostringstream oss {};
  oss << "Input ERROR: " << what << " ID " << id << " exceeds the " << idBound
      << " lines of input.\n";
  postError(oss.str());
  return false;
}

void Problem::readAgent(string l) {
  //Format:
  //"a <agent id> <capacity> <rol>"
  //Where rol is a sequence of object ids most prefered first.
  //Object id 0 marks "prefer to stay unmatched".
  istringstream iss {l};
  char c;
  int id, cap, oid;
  vector<int> oids;

  if(!(iss >> c >> id >> cap)) {
    postError("Input ERROR: malformed agent spec \"" + l + "\"\n");
    return;
  }
  while(iss >> oid)
    oids.push_back(oid);

  if(id < 1) {
    postError("Input ERROR: agent IDs start at 1.\n");
    return;
  }
  if(!chkBound(id, "agent"))
    return;
  if(!chkID(id, agentIDs, "Input ERROR: Duplicate agent ID in agent specs.\n"))
    return;

  if(static_cast<int>(agentIn.size()) < id)
    agentIn.resize(id);
  agentIn[id-1].given = true;
  agentIn[id-1].cap = cap;
  agentIn[id-1].rol = oids;
}

void Problem::readObject(string l) {
  //Format
  //"o <object id> <capacity> <rol>"
  //rol ranks agent ids, 0 marks "prefer to stay unmatched"
  istringstream iss {l};
  char c;
  int id, cap, aid;
  vector<int> aids;

  if(!(iss >> c >> id >> cap)) {
    postError("Input ERROR: malformed object spec \"" + l + "\"\n");
    return;
  }
  while(iss >> aid)
    aids.push_back(aid);

  if(id < 1) {
    postError("Input ERROR: object IDs start at 1.\n");
    return;
  }
  if(!chkBound(id, "object"))
    return;
  if(!chkID(id, objectIDs, "Input ERROR: Duplicate object ID in object specs.\n"))
    return;

  if(static_cast<int>(objectIn.size()) < id)
    objectIn.resize(id);
  objectIn[id-1].given = true;
  objectIn[id-1].cap = cap;
  objectIn[id-1].rol = aids;
}

void Problem::readPriority(string l) {
  //Format
  //"p <agent id> <agent id> ..."
  //agents in the order they get to initiate trades. May be split over
  //several lines; they are concatenated.
  istringstream iss {l};
  char c;
  int aid;
  iss >> c;
  while(iss >> aid)
    priorityIn.push_back(aid);
  hasPrio = true;
}

void Problem::readOwner(string l) {
  //Format
  //"w <agent id> <object id>"
  istringstream iss {l};
  char c;
  int a, o;
  if(!(iss >> c >> a >> o)) {
    postError("Input ERROR: malformed ownership spec \"" + l + "\"\n");
    return;
  }
  ownerIn.push_back({a, o});
  hasOwners = true;
}

bool Problem::buildSide(const vector<Member>& in, const char* what, int otherSize, Side& out) {
  vector<int> caps;
  vector<vector<int>> prefs;
  for(size_t i = 0; i < in.size(); i++) {
    if(!in[i].given) {
      ostringstream oss {};
      oss << "Input ERROR: " << what << " " << i+1 << " not specified (IDs must be 1.."
          << in.size() << ").\n";
      postError(oss.str());
      return false;
    }
    caps.push_back(in[i].cap);
    prefs.push_back(in[i].rol);
  }
  try {
    out = Side(caps, prefs, otherSize);
  }
  catch(const MatchError& e) {
    postError(string("Input ERROR: ") + what + " " + e.what() + "\n");
    return false;
  }
  return true;
}

void Problem::postProcess() {
  if(!ok())
    return;
  int nAgents = static_cast<int>(agentIn.size());
  int nObjects = static_cast<int>(objectIn.size());
  if(!buildSide(agentIn, "agent", nObjects, ag))
    return;
  if(!buildSide(objectIn, "object", nAgents, obj))
    return;

  try {
    if(hasPrio) {
      prio = Priority(priorityIn);
      prio.validate(nAgents);
    }
    if(hasOwners) {
      owners = Ownership(nAgents, nObjects);
      for(const auto& w : ownerIn)
        owners.own(w.first, w.second);
      owners.validate(nAgents, nObjects);
    }
  }
  catch(const MatchError& e) {
    postError(string("Input ERROR: ") + e.what() + "\n");
  }

  agentIn = vector<Member> {};
  objectIn = vector<Member> {};
  priorityIn = vector<int> {};
  ownerIn = vector<std::pair<int, int>> {};
  agentIDs = unordered_set<int> {};
  objectIDs = unordered_set<int> {};
}

void Problem::printMatch(const Matching& match, ostream& os) const {
  os << "m 1\n";
  for(int a = 0; a < match.numAgents(); a++) {
    const auto& objs = match.objectsOf(a);
    if(objs.empty())
      os << "a " << MID {a} << " " << nilMID << "\n";
    for(auto o : objs)
      os << "a " << MID {a} << " " << o << "\n";
  }
}

//Generic Output specializations
template<typename T>
ostream& operator<<(ostream& os, const vector<T>& v) {
  os << "[ ";
  for(const auto& i : v)
    os << i << " ";
  os << "] (" << v.size() << ")";
  return os;
}

ostream& operator<<(ostream& os, const Problem& prob) {
  os << "Problem Spec\nAgents:\n";
  for(int a = 0; a < prob.ag.size(); a++)
    os << "Agent " << MID {a} << ". cap = " << prob.ag.cap(a)
       << " ROL = " << prob.ag.ROL(a) << "\n";
  os << "\nObjects:\n";
  for(int o = 0; o < prob.obj.size(); o++)
    os << "Object " << MID {o} << ". cap = " << prob.obj.cap(o)
       << " ROL = " << prob.obj.ROL(o) << "\n";
  if(prob.hasPrio)
    os << "\nPriority = " << prob.prio.order() << "\n";
  if(prob.hasOwners) {
    os << "\nOwners:\n";
    for(const auto& w : prob.owners.OWNED())
      os << "Agent " << w.first << " owns object " << w.second << "\n";
  }
  return os;
}
