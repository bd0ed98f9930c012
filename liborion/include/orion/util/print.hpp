// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_UTIL_PRINT_HPP
#define ORION_UTIL_PRINT_HPP

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace orion {
namespace util {

// Console output of the tools: statements, weight dumps and scores go to
// stdout, diagnostics go to stderr. Every line is flushed so that the two
// streams interleave in order when both point to a terminal.

template<typename... Args>
void writef(std::ostream& out, std::string_view fmt, Args&&... args) {
  out << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

template<typename Arg>
void pout(Arg&& arg) {
  std::cout << arg << std::endl;
}

template<typename... Args>
void poutf(std::string_view fmt, Args&&... args) {
  writef(std::cout, fmt, args...);
}

template<typename Arg>
void perr(Arg&& arg) {
  std::cerr << arg << std::endl;
}

template<typename... Args>
void perrf(std::string_view fmt, Args&&... args) {
  writef(std::cerr, fmt, args...);
}

// Creates the missing parent directories of a file about to be written.
inline bool create_parent_directory(const std::string& fn) {
  std::filesystem::path parent = std::filesystem::path(fn).parent_path();
  if (parent.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

/*
 * Replaces the content of fn with text (test cases, weight dumps, production
 * counts, decoded generations). Missing parent directories are created.
 * Returns false and leaves the reporting to the caller if the file cannot be
 * opened or written.
 */
inline bool pfile(const std::string& fn, std::string_view text) {
  if (!create_parent_directory(fn)) {
    return false;
  }
  std::ofstream file(fn);
  if (!file) {
    return false;
  }
  file << text;
  file.close();
  return static_cast<bool>(file);
}

} // namespace util
} // namespace orion

#endif  // ORION_UTIL_PRINT_HPP
