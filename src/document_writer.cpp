#include "util/document_writer.hpp"

#include <fstream>

#include "my_error_codes.hpp"

namespace fitbridge {

monad::MyResult<fs::path>
FileDocumentWriter::write(const std::string &filename,
                          const std::string &content) {
  const fs::path name(filename);
  if (filename.empty() || name.has_parent_path() || name.has_root_path() ||
      name == "." || name == "..") {
    return monad::MyResult<fs::path>::Err(
        {.code = my_errors::GENERAL::INVALID_ARGUMENT,
         .what = "Refusing to write outside the output directory: '" +
                 filename + "'"});
  }
  const fs::path target = base_dir_ / name;

  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec && !fs::exists(target.parent_path())) {
      return monad::MyResult<fs::path>::Err(
          {.code = my_errors::GENERAL::FILE_READ_WRITE,
           .what = "Failed to create directory '" +
                   target.parent_path().string() + "': " + ec.message()});
    }
  }

  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    return monad::MyResult<fs::path>::Err(
        {.code = my_errors::GENERAL::FILE_READ_WRITE,
         .what = "Unable to open file for writing: " + target.string()});
  }
  ofs << content;
  ofs.close();
  if (!ofs) {
    return monad::MyResult<fs::path>::Err(
        {.code = my_errors::GENERAL::FILE_READ_WRITE,
         .what = "Failed to write file: " + target.string()});
  }

  BOOST_LOG_SEV(lg_, trivial::info)
      << "Wrote " << content.size() << " bytes to " << target.string();
  return monad::MyResult<fs::path>::Ok(target);
}

} // namespace fitbridge
