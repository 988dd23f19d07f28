/***********[params.h]
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

#ifndef PARAMS_H
#define PARAMS_H

//Run-time settings shared by the matchers. Filled from the command line
//by readOptions(); the defaults are what library users (and the tests) get.
class Params {
public:
  Params() : verbosity {0}, algo {0}, inverse {false}, stats {true} {}
  void readOptions();

  int verbosity; //0 silent, 1 summary, 2 per round, 3 per proposal/cycle
  int algo;      //0 deferred acceptance, 1 two-sided TTC, 2 housing TTC
  bool inverse;  //two-sided TTC: the object side plays the agent role
  bool stats;
};

extern Params params;

#endif
