/***********[problem.h]
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

#ifndef PROBLEM_H
#define PROBLEM_H

#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include <utility>
#include <unordered_set>

//Integer IDs refer to agents and objects. Internally they are 0-based
//indices into the side's vectors; nilMID is the explicit "none" value
//(prefer unmatched / self / unowned / no possession).
//Externally (problem files, match files, the Side constructor) IDs are
//1-based and 0 denotes the nil entry.

class MID {
public:
  int id;
  operator size_t() const { return static_cast<size_t>(id); }
  MID(int i) : id {i} {}
  MID() : id {-1} {}
  bool isNil() const { return id < 0; }
  int ext() const { return id + 1; }
  static MID fromExt(int e) { return MID {e - 1}; }
  bool operator==(const MID& o) const { return id == o.id; }
  bool operator!=(const MID& o) const { return id != o.id; }
  bool operator<(const MID& o) const { return id < o.id; }
};

const MID nilMID {-1};

std::ostream& operator<<(std::ostream& os, const MID& m);

typedef std::pair<MID, MID> MIDPair;

//One side of a market: the agents (students, tenants, proposers) or the
//objects (schools, houses, respondents).
class Side {
public:
  Side() : caps {}, rol {}, nOther {0} {}
  //capacities[i] and prefs[i] describe member i+1. Preference entries are
  //1-based IDs on the other side, 0 = prefer unmatched.
  Side(const std::vector<int>& capacities,
       const std::vector<std::vector<int>>& prefs,
       int otherSideSize);

  int size() const { return static_cast<int>(caps.size()); }
  int otherSize() const { return nOther; }
  int cap(MID i) const { return caps[i]; }
  const std::vector<int>& CAPS() const { return caps; }
  const std::vector<MID>& ROL(MID i) const { return rol[i]; }
  //entries in i's list, including a "prefer unmatched" entry
  int prefLen(MID i) const { return static_cast<int>(rol[i].size()); }

  //j appears in i's list ahead of any "prefer unmatched" entry
  bool accepts(MID i, MID j) const;
  bool allCapsOne() const;

private:
  std::vector<int> caps;
  std::vector<std::vector<MID>> rol;
  int nOther;
};

//Permutation of the agents fixing the order of housing TTC steps.
class Priority {
public:
  Priority() : ord {} {}
  explicit Priority(const std::vector<int>& agentIds); //1-based
  static Priority identity(int nAgents);

  void validate(int nAgents) const;
  bool empty() const { return ord.empty(); }
  int size() const { return static_cast<int>(ord.size()); }
  const std::vector<MID>& order() const { return ord; }

private:
  std::vector<MID> ord;
};

//Initial agent-object possession for housing TTC. A default constructed or
//(nAgents, nObjects) constructed instance owns nothing.
class Ownership {
public:
  Ownership() : nAg {0}, nObj {0}, owned {} {}
  Ownership(int nAgents, int nObjects) : nAg {nAgents}, nObj {nObjects}, owned {} {}

  void own(int agent, int object); //1-based
  void validate(int nAgents, int nObjects) const;

  int numAgents() const { return nAg; }
  int numObjects() const { return nObj; }
  const std::vector<MIDPair>& OWNED() const { return owned; } //(agent, object)
  MID ownerOf(MID object) const;

private:
  int nAg;
  int nObj;
  std::vector<MIDPair> owned;
};

//Agent x object assignment. Pairings are only ever added.
class Matching {
public:
  Matching() : nAg {0}, nObj {0}, rel {}, byAgent {}, byObject {}, npairs {0} {}
  Matching(int nAgents, int nObjects);

  void add(MID agent, MID object);
  bool has(MID agent, MID object) const;
  const std::vector<MID>& objectsOf(MID agent) const { return byAgent[agent]; }
  const std::vector<MID>& agentsOf(MID object) const { return byObject[object]; }
  MID objectOf(MID agent) const; //first object held, nilMID if none

  int numAgents() const { return nAg; }
  int numObjects() const { return nObj; }
  int nPairs() const { return npairs; }

  Matching transposed() const;
  bool operator==(const Matching& o) const;
  bool operator!=(const Matching& o) const { return !(*this == o); }

private:
  int nAg;
  int nObj;
  std::vector<bool> rel; //object-major: rel[o*nAg + a]
  std::vector<std::vector<MID>> byAgent;
  std::vector<std::vector<MID>> byObject;
  int npairs;
};

std::ostream& operator<<(std::ostream& os, const Matching& m);

class Problem {
public:
  Problem() : ag {}, obj {}, prio {}, owners {}, hasPrio {false}, hasOwners {false},
              errMsg {}, probOK {true}, agentIn {}, objectIn {}, priorityIn {},
              ownerIn {}, agentIDs {}, objectIDs {},
              idBound {std::numeric_limits<int>::max()} {}
  Problem(const Side& agents, const Side& objects);

  //Problem IO and error processing
  bool readProblem(std::string filename);
  bool readProblem(std::istream& in);
  void readAgent(std::string l);
  void readObject(std::string l);
  void readPriority(std::string l);
  void readOwner(std::string l);

  //  Post and Error processing
  void postProcess();
  bool chkID(int id, std::unordered_set<int>& Ids, std::string errmsg);
  void postError(std::string msg) {
    errMsg += msg;
    probOK = false;
  }
  bool ok() const { return probOK; }
  std::string& getError() { return errMsg; }

  void setPriority(const Priority& p) { prio = p; hasPrio = true; }
  void setOwnership(const Ownership& o) { owners = o; hasOwners = true; }

  const Side& agents() const { return ag; }
  const Side& objects() const { return obj; }
  bool hasPriority() const { return hasPrio; }
  bool hasOwnership() const { return hasOwners; }
  const Priority& priority() const { return prio; }
  const Ownership& ownership() const { return owners; }

  void printMatch(const Matching& match, std::ostream& os = std::cout) const;
  friend std::ostream& operator<<(std::ostream& os, const Problem& prob);

private:
  struct Member {
    Member() : given {false}, cap {0}, rol {} {}
    bool given;
    int cap;
    std::vector<int> rol;
  };

  Side ag;
  Side obj;
  Priority prio;
  Ownership owners;
  bool hasPrio;
  bool hasOwners;
  std::string errMsg;
  bool probOK;

  //raw input, consumed by postProcess()
  std::vector<Member> agentIn;
  std::vector<Member> objectIn;
  std::vector<int> priorityIn;
  std::vector<std::pair<int, int>> ownerIn;
  std::unordered_set<int> agentIDs;
  std::unordered_set<int> objectIDs;
  //a valid file names every member on its own line, so no ID exceeds
  //the number of lines read
  int idBound;

  bool chkBound(int id, const char* what);
  bool buildSide(const std::vector<Member>& in, const char* what, int otherSize, Side& out);
};

#endif
