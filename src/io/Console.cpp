/* @file Console.cpp
 * @brief y/n prompt
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

// Linux headers
#include <unistd.h>

// Keel headers
#include "io/Console.hpp"

using namespace keel::io;

bool Console::interactive() const { return ::isatty(STDIN_FILENO) == 1; }

bool Console::confirm(const std::string& question) {
  out_ << question << " [y/N] " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer))
    return false;

  answer.erase(std::remove_if(answer.begin(), answer.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               answer.end());
  std::transform(answer.begin(), answer.end(), answer.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return answer == "y" || answer == "yes";
}
