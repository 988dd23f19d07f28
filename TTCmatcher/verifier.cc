/***********[verifier.cc]
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
#include <new>
#include "problem.h"
#include "matchchk.h"
#include "matcher.h"
#include "minisat/utils/Options.h"

using std::cout;

using Minisat::setUsageHelp;
using Minisat::IntOption;
using Minisat::IntRange;
using Minisat::parseOptions;
using Minisat::printUsageAndExit;

static int verify(int argc, char** argv) {
  setUsageHelp("usage: %s [options] <matching_problem_spec_file> <match_spec_file>\n");
  IntOption verb("CHECK", "check-verb", "Verbosity level (0=silent, 1=some, 2=more).", 0, IntRange(0,2));
  IntOption algo("CHECK", "mech",
                 "Mechanism that produced the match: 0 = DA (stability), 1 = two-sided TTC,"
                 " 2 = housing TTC (individual rationality)\n", 0, IntRange(0,2));
  parseOptions(argc, argv, true);
  if(argc != 3)
    printUsageAndExit(argc, argv);

  Problem prob{};
  if(!prob.readProblem(argv[1])) {
    cout << "Problems reading allocation problem: \"" << argv[1] << "\"\n";
    cout << prob.getError();
    return 1;
  }
  MatchChk matchChk {&prob};
  if(!matchChk.readMatch(argv[2])) {
    cout << "Problems reading match file: \"" << argv[2] << "\"\n";
    cout << matchChk.getError();
    return 1;
  }

  if(verb > 0) {
    cout << "Allocation problem:\n";
    cout << prob;
    cout << "Match:\n";
    cout << matchChk;
  }

  if(matchChk.noMatch())
    cout << "No match found.\n";
  else if(!matchChk.check(algo)) {
    cout << "ERROR: Invalid Match.\n";
    cout << matchChk.getError();
    return 1;
  }
  else {
    cout << "Match ok.\n";
    matchChk.printMatchStats();
  }
  return 0;
}

int main(int argc, char** argv) {
  try {
    return verify(argc, argv);
  }
  catch(const std::bad_alloc&) {
    return reportOutOfMemory(nullptr);
  }
}
