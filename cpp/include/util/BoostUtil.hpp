#pragma once

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <string>

namespace boost_util {

/*
 * Writes str to the given file. If append is true and the file already exists, str is appended
 * to its current contents; otherwise the file is overwritten.
 *
 * Throws util::CleanException if the file cannot be opened.
 */
void write_str_to_file(const std::string& str, const boost::filesystem::path& filename,
                       bool append = false);

namespace program_options {

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc, which
 * should be a boost::program_options::options_description. Returns the parsed variables_map.
 *
 * Parse errors (unknown options, malformed values, etc.) are rethrown as util::CleanException.
 */
template <typename... Ts>
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
