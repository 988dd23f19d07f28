/***********[match_main.cc]

-------

Main function for reading in an allocation problem and matching it with
deferred acceptance, two-sided top trading cycles or housing top trading
cycles.

------

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
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <limits>
#include <memory>
#include <new>
#include "problem.h"
#include "errors.h"
#include "damatcher.h"
#include "ttcmatcher.h"
#include "httcmatcher.h"
#include "minisat/utils/Options.h"
#include "params.h"

using Minisat::setUsageHelp;
using Minisat::printUsageAndExit;
using Minisat::BoolOption;
using Minisat::IntOption;
using Minisat::IntRange;
using Minisat::parseOptions;
using std::cout;
using std::cerr;

static const int vnumMajor {1};
static const int vnumMinor {0};

//Matcher whose statistics a signal handler should report.
static Matcher* running {};

static void onSignal(int signum) {
  if(running) {
    cout << "#ERROR: Caught Signal " << signum << "\n";
    running->printStatsAndExit(signum, 1);
  }
  cout.flush();
  cerr.flush();
  _exit(0);
}

//Lower the soft limit of resource to lim unless the hard limit is already
//lower. Returns false if setrlimit refused.
static bool lowerLimit(int resource, rlim_t lim) {
  rlimit rl;
  if(getrlimit(resource, &rl) == -1)
    return false;
  if(rl.rlim_max != RLIM_INFINITY && lim >= rl.rlim_max)
    return true;
  rl.rlim_cur = lim;
  return setrlimit(resource, &rl) != -1;
}

static Matcher* makeMatcher() {
  switch(params.algo) {
  case 0:
    cout << "#ttcmatch using agent proposing deferred acceptance\n";
    return new DAmatcher {};
  case 1:
    cout << "#ttcmatch using two-sided top trading cycles, "
         << (params.inverse ? "objects" : "agents") << " trade\n";
    return new TTCmatcher {params.inverse};
  default:
    cout << "#ttcmatch using housing top trading cycles\n";
    return new HTTCmatcher {};
  }
}

int main(int argc, char** argv) {
  std::unique_ptr<Matcher> matcher;
  try {
    setUsageHelp("usage: %s [options] <allocation_problem_spec_file>\n");
    BoolOption version("MAIN", "version", "Print version number and exit\n", false);
    IntOption cpuLim("MAIN", "cpu-lim",
                     "Limit on CPU time allowed in seconds (-1 no limit).\n",
                     -1, IntRange(-1, std::numeric_limits<int>::max()));
    IntOption memLim("MAIN", "mem-lim",
                     "Limit on memory usage in megabytes (-1 no limit)\n",
                     -1, IntRange(-1, std::numeric_limits<int>::max()));

    parseOptions(argc, argv, true);
    if(version) {
      cout << "ttcmatch " << vnumMajor << "." << vnumMinor << "\n";
      return 0;
    }
    if(argc != 2)
      printUsageAndExit(argc, argv);

    if(cpuLim >= 0 && !lowerLimit(RLIMIT_CPU, static_cast<rlim_t>(cpuLim)))
      cout << "# WARNING! Could not set resource limit: CPU-time.\n";
    if(memLim >= 0 && !lowerLimit(RLIMIT_AS, static_cast<rlim_t>(memLim) * 1024 * 1024))
      cout << "# WARNING! Could not set resource limit: Virtual memory.\n";
    params.readOptions();

    cout << "#ttcmatch " << vnumMajor << "." << vnumMinor << "\n";
    matcher.reset(makeMatcher());

    for(int sig : {SIGINT, SIGXCPU, SIGSEGV, SIGTERM, SIGABRT})
      signal(sig, onSignal);

    Problem prob {};
    if(!prob.readProblem(argv[1])) {
      cout << "Problems reading allocation problem: \"" << argv[1] << "\"\n";
      cout << prob.getError();
      return 1;
    }
    if(params.verbosity > 0) {
      cout << "#Problem Read: " << prob.agents().size() << " agents, "
           << prob.objects().size() << " objects\n";
      if(params.verbosity > 2)
        cout << prob;
    }

    running = matcher.get();
    Matching match = matcher->match(prob);
    running = nullptr;
    if(params.stats)
      matcher->printStats();
    cout << "#Final Match\n";
    prob.printMatch(match);
  }
  catch(const MatchError& e) {
    cout << "#ERROR: " << e.what() << "\n";
    return 1;
  }
  catch(const std::bad_alloc&) {
    return reportOutOfMemory(matcher.get());
  }
  cout.flush();
  cerr.flush();
  return 0;
}
