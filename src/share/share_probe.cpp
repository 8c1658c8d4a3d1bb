#include "share/share_probe.hpp"

#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace dscapture::share {

namespace {

ShareProbeResult FromErrorCode(const std::error_code& ec) {
  ShareProbeResult result;
  switch (ec.value()) {
  case ENOENT:
  case ENOTDIR:
    result.code = kShareErrorBadNetName;
    result.message = "The network name cannot be found.";
    break;
  case EACCES:
  case EPERM:
    result.code = kShareErrorAccessDenied;
    result.message = "Access is denied.";
    break;
  case EHOSTUNREACH:
  case ENETUNREACH:
  case EHOSTDOWN:
  case ENETDOWN:
    result.code = kShareErrorBadNetPath;
    result.message = "The network path was not found.";
    break;
  case ETIMEDOUT:
  case ECONNRESET:
  case ESTALE:
    result.code = kShareErrorNetNameDeleted;
    result.message = "The specified network name is no longer available.";
    break;
  default:
    result.code = kShareErrorUnexpectedNetwork;
    result.message = "An unexpected network error occurred. (" + ec.message() + ")";
    break;
  }
  return result;
}

} // namespace

ShareProbeResult ProbeShare(const fs::path& share_path) {
  std::error_code ec;
  const fs::file_status status = fs::status(share_path, ec);
  if (ec) {
    return FromErrorCode(ec);
  }
  if (!fs::is_directory(status)) {
    return FromErrorCode(std::make_error_code(std::errc::not_a_directory));
  }

  fs::directory_iterator listing(share_path, ec);
  if (ec) {
    return FromErrorCode(ec);
  }

  ShareProbeResult result;
  result.reachable = true;
  return result;
}

} // namespace dscapture::share
