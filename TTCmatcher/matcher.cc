/***********[matcher.cc]
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
#include <sstream>
#include <unistd.h>
#include "matcher.h"
#include "errors.h"

using std::cout;
using std::cerr;

void Matcher::printStatsAndExit(int signum, int exit_code) const {
  cout << "#" << name() << " interrupted (signal " << signum << ")\n";
  printStats();
  cout.flush();
  cerr.flush();
  _exit(exit_code);
}

int reportOutOfMemory(const Matcher* m) {
  cout << "#ERROR: could not allocate memory\n";
  if(m)
    m->printStats();
  cout.flush();
  cerr.flush();
  return outOfMemoryExit;
}

void checkSides(const Side& agents, const Side& objects) {
  if(agents.otherSize() != objects.size() || objects.otherSize() != agents.size()) {
    std::ostringstream oss {};
    oss << "agent lists rank " << agents.otherSize() << " objects and object lists rank "
        << objects.otherSize() << " agents, market has " << agents.size()
        << " agents and " << objects.size() << " objects";
    throw DimensionMismatchError(oss.str());
  }
}
