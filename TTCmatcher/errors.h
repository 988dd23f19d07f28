/***********[errors.h]
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

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

//Errors raised while validating a market before any matcher runs.
//None of them are recoverable inside a matcher: the invocation is abandoned
//and no partial matching is produced.

class MatchError : public std::runtime_error {
public:
  explicit MatchError(const std::string& msg) : std::runtime_error {msg} {}
};

//Capacities (or other scalar settings) violate a matcher's precondition,
//e.g. housing TTC requires every capacity to equal 1.
class ConfigurationError : public MatchError {
public:
  explicit ConfigurationError(const std::string& msg) : MatchError {msg} {}
};

//An auxiliary structure (ownership, priority, preference entry) was declared
//for a market of a different size.
class DimensionMismatchError : public MatchError {
public:
  explicit DimensionMismatchError(const std::string& msg) : MatchError {msg} {}
};

//An object has more than one initial owner (or an agent more than one object).
class OwnershipIntegrityError : public MatchError {
public:
  explicit OwnershipIntegrityError(const std::string& msg) : MatchError {msg} {}
};

#endif
