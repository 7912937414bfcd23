#pragma once

#include <istream>
#include <vector>

#include "customio/console_output.hpp"
#include "data/activity.hpp"
#include "result_monad.hpp"

namespace fitbridge {

class IActivitySelector {
public:
  virtual ~IActivitySelector() = default;

  virtual monad::MyResult<data::Activity>
  select(const std::vector<data::Activity> &activities) = 0;
};

// Prints a numbered list and reads a 1-based choice from `in`.
class ConsoleActivitySelector : public IActivitySelector {
public:
  ConsoleActivitySelector(customio::ConsoleOutput &output, std::istream &in)
      : output_(output), in_(in) {}

  monad::MyResult<data::Activity>
  select(const std::vector<data::Activity> &activities) override;

private:
  customio::ConsoleOutput &output_;
  std::istream &in_;
};

} // namespace fitbridge
