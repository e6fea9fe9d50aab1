/* @file EnvFile.cpp
 * @brief KEY=VALUE parsing for the stack's environment file.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

// Keel headers
#include "core/EnvFile.hpp"

using namespace keel::core;

namespace {

  std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
      return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
  }

  std::string unquote(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
      return v.substr(1, v.size() - 2);
    // unquoted values may carry a trailing " # comment"
    if (auto pos = v.find(" #"); pos != std::string::npos)
      return trim(v.substr(0, pos));
    return v;
  }

} // namespace

EnvFile::EnvFile(std::string path) : path_(std::move(path)) {}

ConfigSource EnvFile::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[EnvFile] cannot open " + path_);

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad())
    throw std::runtime_error("[EnvFile] read error on " + path_);
  return parse(ss.str());
}

ConfigSource EnvFile::parse(const std::string& text) {
  std::map<std::string, std::string> values;
  std::istringstream lines(text);
  std::string line;

  while (std::getline(lines, line)) {
    line = trim(line);
    if (line.empty() || line.front() == '#')
      continue;
    if (line.starts_with("export "))
      line = trim(line.substr(7));

    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;

    std::string key = trim(line.substr(0, eq));
    std::string value = unquote(trim(line.substr(eq + 1)));
    values[key] = value; // later lines win, same as compose
  }
  return ConfigSource(std::move(values));
}
