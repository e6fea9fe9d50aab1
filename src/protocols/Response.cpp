/* @file Response.cpp
 * @brief JSON decoding of compose `ps` output.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <sstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Keel headers
#include "protocols/Response.hpp"

using namespace keel::protocols;
using nlohmann::json;

namespace {

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
      return {};
    return it->get<std::string>();
  }

  ServiceStatus toStatus(const json& obj) {
    ServiceStatus s;
    s.service = stringField(obj, "Service");
    s.name = stringField(obj, "Name");
    s.state = lower(stringField(obj, "State"));
    if (auto it = obj.find("ExitCode"); it != obj.end() && it->is_number_integer())
      s.exitCode = it->get<int>();
    if (s.service.empty())
      s.service = s.name;
    return s;
  }

} // namespace

std::optional<Response> Response::fromWire(const std::string& text) {
  Response response;

  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return response; // nothing deployed, empty listing

  try {
    if (text[first] == '[') {
      auto arr = json::parse(text);
      for (const auto& obj : arr)
        if (obj.is_object())
          response.services.push_back(toStatus(obj));
      return response;
    }

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos)
        continue;
      auto obj = json::parse(line);
      if (obj.is_object())
        response.services.push_back(toStatus(obj));
    }
  } catch (const json::parse_error&) {
    return std::nullopt;
  }
  return response;
}
