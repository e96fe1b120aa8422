#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <fstream>

namespace boost_util {

void write_str_to_file(const std::string& str, const boost::filesystem::path& filename,
                       bool append) {
  std::ios_base::openmode mode = append ? std::ios_base::app : std::ios_base::trunc;
  std::ofstream file(filename.string(), std::ios_base::out | mode);
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file: {}", filename.string());
  }
  file << str;
  file.close();
  if (file.fail()) {
    throw util::CleanException("Failed writing to file: {}", filename.string());
  }
}

}  // namespace boost_util
