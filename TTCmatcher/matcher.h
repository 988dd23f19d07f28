/***********[matcher.h]
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

#ifndef MATCHER_H
#define MATCHER_H

#include "problem.h"

//Common interface of the mechanisms. A matcher keeps the statistics of
//its last run so they can be printed after match() returns (or from a
//signal handler if it never does).
class Matcher {
public:
  virtual ~Matcher() {}
  virtual Matching match(const Problem& prob) = 0;
  virtual const char* name() const = 0;
  virtual void printStats() const = 0;
  void printStatsAndExit(int signum, int exit_code) const;
};

//Exit status of a run that ran out of memory.
const int outOfMemoryExit {100};

//Report an allocation failure together with the statistics m (may be
//null) gathered so far. Returns outOfMemoryExit.
int reportOutOfMemory(const Matcher* m);

//Agents' lists must rank objects of this market and vice versa.
void checkSides(const Side& agents, const Side& objects);

#endif
