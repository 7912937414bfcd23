#pragma once

#include <cstddef>
#include <iostream>
#include <string>

#include <unistd.h>

// User-facing terminal output. Diagnostics belong in Boost.Log; this class
// only carries what the person at the keyboard has to read.
//
//   customio::ConsoleOutput out(3);
//   out.info() << "Opening browser" << std::endl;
//   out.error() << "failed: " << err.what << std::endl;
//
// Verbosity follows CliCtx::verbosity_level(): 0 silent, 1 error, 2 warning,
// 3 info, 4 debug, 5 trace.

namespace customio {

class ConsoleOutput {
public:
  // Emits the colour code on construction and the reset on destruction so a
  // single streamed expression is coloured as a whole.
  class Line {
  public:
    Line(std::ostream *os, const char *code) : os_(os), code_(code) {
      if (os_ && code_) {
        *os_ << code_;
      }
    }
    Line(const Line &) = delete;
    Line &operator=(const Line &) = delete;
    ~Line() {
      if (os_ && code_) {
        *os_ << "\033[0m";
      }
    }

    template <typename T> Line &operator<<(const T &v) {
      if (os_) {
        *os_ << v;
      }
      return *this;
    }
    using Manip = std::ostream &(*)(std::ostream &);
    Line &operator<<(Manip m) {
      if (os_) {
        m(*os_);
      }
      return *this;
    }

  private:
    std::ostream *os_;
    const char *code_;
  };

  explicit ConsoleOutput(std::size_t verbosity)
      : ConsoleOutput(verbosity, std::cout, std::cerr,
                      ::isatty(STDERR_FILENO) == 1) {}

  ConsoleOutput(std::size_t verbosity, std::ostream &out, std::ostream &err,
                bool colors = false)
      : verbosity_(verbosity), out_(out), err_(err), colors_(colors) {}

  Line error() { return line(1, "\033[31m"); }
  Line warning() { return line(2, "\033[33m"); }
  Line info() { return line(3, nullptr); }
  Line success() { return line(3, "\033[32m"); }
  Line debug() { return line(4, "\033[36m"); }
  Line trace() { return line(5, "\033[90m"); }

  // Plain stdout, never filtered: listings and prompts.
  std::ostream &out() { return out_; }

  std::size_t verbosity() const { return verbosity_; }

private:
  Line line(std::size_t level, const char *code) {
    if (verbosity_ < level) {
      return Line(nullptr, nullptr);
    }
    return Line(&err_, colors_ ? code : nullptr);
  }

  std::size_t verbosity_;
  std::ostream &out_;
  std::ostream &err_;
  bool colors_;
};

} // namespace customio
