#pragma once

#include <string>
#include <vector>

#include "result_monad.hpp"
#include "util/my_logging.hpp"

namespace fitbridge {

class IBrowserLauncher {
public:
  virtual ~IBrowserLauncher() = default;

  // Hands `url` to the desktop's default browser. Not being able to do so is
  // fatal for the handshake.
  virtual monad::MyVoidResult open(const std::string &url) = 0;
};

// xdg-open on Linux, open on macOS, rundll32 url.dll,FileProtocolHandler on
// Windows. The opener exits as soon as it has
// handed the URL over, so its exit status is waited for.
class SystemBrowserLauncher : public IBrowserLauncher {
public:
  SystemBrowserLauncher() = default;

  monad::MyVoidResult open(const std::string &url) override;

  static std::vector<std::string> opener_command(const std::string &url);

private:
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace fitbridge
