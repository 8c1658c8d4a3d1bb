#pragma once

#include <filesystem>
#include <string>

namespace dscapture::share {

// Legacy OS error codes reported by the numeric connector.
constexpr int kShareErrorAccessDenied = 5;
constexpr int kShareErrorBadNetPath = 53;
constexpr int kShareErrorUnexpectedNetwork = 59;
constexpr int kShareErrorNetNameDeleted = 64;
constexpr int kShareErrorBadNetName = 67;
constexpr int kShareErrorNoNetwork = 1203;
constexpr int kShareErrorSessionCredentialConflict = 1219;
constexpr int kShareErrorLogonFailure = 1326;

struct ShareProbeResult {
  bool reachable = false;
  int code = 0;
  std::string message;
};

// Checks that a share mount point is present and listable. Shares are
// mounted by the host (autofs/cifs); this only validates the session is live
// and maps the OS error onto the share error vocabulary.
ShareProbeResult ProbeShare(const std::filesystem::path& share_path);

} // namespace dscapture::share
