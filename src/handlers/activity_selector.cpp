#include "handlers/activity_selector.hpp"

#include <fmt/format.h>

#include <charconv>
#include <string>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace fitbridge {

monad::MyResult<data::Activity> ConsoleActivitySelector::select(
    const std::vector<data::Activity> &activities) {
  if (activities.empty()) {
    return monad::MyResult<data::Activity>::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND, "No activities logged on that date."));
  }

  auto &out = output_.out();
  out << "Available Activities:" << std::endl;
  for (std::size_t i = 0; i < activities.size(); ++i) {
    const auto &a = activities[i];
    out << "ID: " << i + 1 << '\n'
        << "Activity Name: " << a.name << '\n'
        << fmt::format("Distance: {:.2f}", a.distance) << '\n'
        << "Start date: " << a.start_date << ' ' << a.start_time << '\n'
        << "-------------" << std::endl;
  }
  out << "Enter the number of the activity you want to choose: " << std::flush;

  std::string line;
  if (!std::getline(in_, line)) {
    return monad::MyResult<data::Activity>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "No activity choice was entered."));
  }
  const std::string input = stringutil::trim(line);

  std::size_t choice = 0;
  auto [ptr, ec] =
      std::from_chars(input.data(), input.data() + input.size(), choice);
  if (input.empty() || ec != std::errc() || ptr != input.data() + input.size() ||
      choice < 1 || choice > activities.size()) {
    return monad::MyResult<data::Activity>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("Invalid choice '{}'. Please enter a number between 1 and {}.",
                    input, activities.size())));
  }

  const auto &chosen = activities[choice - 1];
  out << "You selected: " << choice << ' ' << chosen.activity_parent_name << ' '
      << chosen.start_date << ' ' << chosen.start_time << std::endl;
  return monad::MyResult<data::Activity>::Ok(chosen);
}

} // namespace fitbridge
