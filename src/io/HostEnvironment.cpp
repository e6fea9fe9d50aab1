/* @file HostEnvironment.cpp
 * @brief uname/access/PATH/group lookups - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

// Linux headers
#include <errno.h>
#include <grp.h>
#include <sys/utsname.h>
#include <unistd.h>

// Keel headers
#include "io/HostEnvironment.hpp"
#include "io/ComposeClient.hpp"
#include "io/ProcessRunner.hpp"

using namespace keel::io;

std::string HostEnvironment::osFamily() const {
  struct utsname u;
  if (::uname(&u) != 0) {
    std::cerr << "Error " << errno << " from uname: " << strerror(errno) << "\n";
    return "unknown";
  }
  return u.sysname;
}

FileAccess HostEnvironment::fileAccess(const std::string& path) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec))
    return FileAccess::Missing;
  if (std::filesystem::is_directory(path, ec) || ::access(path.c_str(), R_OK) != 0)
    return FileAccess::Unreadable;
  return FileAccess::Readable;
}

std::optional<std::string> HostEnvironment::findExecutable(const std::string& name) const {
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0)
      return name;
    return std::nullopt;
  }

  const char* path = std::getenv("PATH");
  if (!path)
    return std::nullopt;

  std::istringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty())
      dir = ".";
    std::filesystem::path candidate = std::filesystem::path(dir) / name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) &&
        ::access(candidate.c_str(), X_OK) == 0)
      return candidate.string();
  }
  return std::nullopt;
}

bool HostEnvironment::inGroup(const std::string& group) const {
  if (::geteuid() == 0)
    return true;

  struct group* gr = ::getgrnam(group.c_str());
  if (!gr)
    return false; // group doesn't exist on this host

  if (::getegid() == gr->gr_gid)
    return true;

  int n = ::getgroups(0, nullptr);
  if (n < 0) {
    std::cerr << "Error " << errno << " from getgroups: " << strerror(errno) << "\n";
    return false;
  }
  std::vector<gid_t> gids(static_cast<std::size_t>(n));
  n = ::getgroups(n, gids.data());
  for (int i = 0; i < n; ++i)
    if (gids[static_cast<std::size_t>(i)] == gr->gr_gid)
      return true;
  return false;
}

bool HostEnvironment::composeAvailable() const {
  if (!runner_)
    return false;
  return DockerCompose::detectFlavor(*runner_).has_value();
}
