#pragma once

#include <pwd.h>
#include <string>
#include <unistd.h>

namespace dscapture::core {

// Short host name of this machine, or "localhost" when it cannot be read.
inline std::string LocalHostName() {
  char name[256] = {};
  if (gethostname(name, sizeof(name)) == 0) {
    name[sizeof(name) - 1U] = '\0';
    if (name[0] != '\0') {
      return std::string(name);
    }
  }
  return "localhost";
}

// Login name of the effective user, or "unknown".
inline std::string LocalUserName() {
  const passwd* entry = getpwuid(geteuid());
  if (entry != nullptr && entry->pw_name != nullptr && entry->pw_name[0] != '\0') {
    return std::string(entry->pw_name);
  }
  return "unknown";
}

} // namespace dscapture::core
