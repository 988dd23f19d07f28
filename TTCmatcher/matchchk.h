/***********[matchchk.h]
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

#ifndef MATCHCHK_H
#define MATCHCHK_H

#include <iostream>
#include <string>
#include <vector>
#include "problem.h"
#include "rankindex.h"

//Checks a matching against the problem it was computed for. Every check
//appends a line to the error text for each violation it finds.
class MatchChk {
public:
  explicit MatchChk(const Problem* p);

  //Match file IO
  bool readMatch(std::string filename);
  bool readMatch(std::istream& in);
  void readAgent(std::string l);
  void readValid(std::string l);
  void setMatch(const Matching& m) { match = m; nomatch = false; }

  //Each agent and object holds at most its capacity.
  bool checkCapacities();
  //Each pair is ranked acceptable by both sides.
  bool checkAcceptable();
  //Agents rank their object acceptable (one-sided markets).
  bool checkAgentAcceptable();
  //No agent-object pair would both rather be together (two-sided, agent
  //capacities at most 1).
  bool checkStable();
  //No initial owner ends up worse than with its endowment.
  bool checkIndividuallyRational();
  //Checks appropriate to the mechanism: 0 DA, 1 two-sided TTC, 2 housing TTC.
  bool check(int algo);

  void postError(std::string msg) {
    errMsg += msg;
    checkOK = false;
  }
  bool ok() const { return checkOK; }
  bool noMatch() const { return nomatch; }
  std::string& getError() { return errMsg; }
  const Matching& MATCH() const { return match; }

  void printMatchStats(std::ostream& os = std::cout) const;
  friend std::ostream& operator<<(std::ostream& os, const MatchChk& chk);

private:
  const Problem* prob;
  Matching match;
  std::vector<PrefRanks> agentRanks;
  std::vector<PrefRanks> objectRanks;
  std::string errMsg;
  bool checkOK;
  bool nomatch;

  //object o would take agent a over someone it holds, or into a free seat
  bool wouldAccept(MID o, MID a) const;
};

#endif
