#pragma once

#include <filesystem>
#include <string>

#include "result_monad.hpp"
#include "util/my_logging.hpp"

namespace fitbridge {

namespace fs = std::filesystem;

class IDocumentWriter {
public:
  virtual ~IDocumentWriter() = default;

  // Writes `content` to `filename`, returning the path actually written.
  virtual monad::MyResult<fs::path> write(const std::string &filename,
                                          const std::string &content) = 0;
};

// Writes under a base directory, creating it when missing. `filename` must
// be a single path component. Existing files are replaced.
class FileDocumentWriter : public IDocumentWriter {
public:
  explicit FileDocumentWriter(fs::path base_dir)
      : base_dir_(std::move(base_dir)) {}

  monad::MyResult<fs::path> write(const std::string &filename,
                                  const std::string &content) override;

private:
  fs::path base_dir_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace fitbridge
