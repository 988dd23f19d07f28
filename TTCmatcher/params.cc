/***********[params.cc]
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

#include "params.h"
#include "minisat/utils/Options.h"

using Minisat::IntOption;
using Minisat::IntRange;
using Minisat::BoolOption;

Params params {};

static IntOption opt_verb("MATCH", "verb",
                          "Verbosity level (0=silent, 1=summary, 2=rounds, 3=everything).\n",
                          0, IntRange(0, 3));
static IntOption opt_algo("MATCH", "algo",
                          "Mechanism: 0 = deferred acceptance, 1 = two-sided top trading cycles,"
                          " 2 = housing top trading cycles\n",
                          0, IntRange(0, 2));
static BoolOption opt_inverse("MATCH", "inverse",
                              "Two-sided TTC: let the objects play the agent role "
                              "(result is Pareto efficient for the objects)\n",
                              false);
static BoolOption opt_stats("MATCH", "stats", "Print matcher statistics\n", true);

void Params::readOptions() {
  verbosity = opt_verb;
  algo = opt_algo;
  inverse = opt_inverse;
  stats = opt_stats;
}
