#pragma once

#include "outcome/capture_outcome.hpp"
#include "share/share_connector.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::share {

enum class ConnectionState {
  kNotConnected,
  kConnectedViaLegacy,
  kConnectedViaModern,
};

std::string_view ToString(ConnectionState state);

struct ShareConnectionSettings {
  // Manager parameter ShareConnectorType.
  std::string connector_type;
  // Manager parameters bionetuser / bionetpwd (already decoded).
  std::string user;
  std::string password;
  // Prepended to user names that carry no domain part.
  std::string host_name;
  // Account used when no credentialed session is open.
  std::string local_user;
  std::filesystem::path unc_mount_root = "/mnt";
};

// Prepends `<host>\` to user names without a domain separator.
std::string NormalizeUserName(std::string_view user, std::string_view host_name);

struct ShareConnectResult {
  ConnectionState state = ConnectionState::kNotConnected;
  // Set when the connect attempt failed.
  std::optional<outcome::CaptureOutcome> error;

  bool connected() const {
    return state != ConnectionState::kNotConnected;
  }
};

using ConnectorFactory = std::function<std::unique_ptr<IShareConnector>(ConnectorKind)>;

// Owns at most one credentialed share session for a capture invocation.
//
// Legacy connector failures are classified by OS error code:
//   1219, 1203, 53, 64 -> abort all processing (retry eligible)
//   anything else      -> failed
// Modern connector failures are classified from their message text.
class ShareConnection {
public:
  ShareConnection(ShareConnectionSettings settings, core::logging::Logger& logger);
  ShareConnection(ShareConnectionSettings settings, core::logging::Logger& logger,
                  ConnectorFactory factory);
  ~ShareConnection();

  ShareConnection(const ShareConnection&) = delete;
  ShareConnection& operator=(const ShareConnection&) = delete;

  ShareConnectResult Connect(const std::string& share_path);

  // Idempotent.
  void Disconnect();

  ConnectionState state() const {
    return state_;
  }

  ConnectorKind connector_kind() const {
    return kind_;
  }

  const std::string& user_name() const {
    return user_name_;
  }

  // Suffix appended to copy log lines, e.g. " as user HOST\svc using legacy share connector".
  std::string ConnectionDescription() const;

private:
  ShareConnectResult FailLegacy(const std::string& share_path, int code);
  ShareConnectResult FailModern(const std::string& share_path, const std::string& message);

  ShareConnectionSettings settings_;
  core::logging::Logger& logger_;
  ConnectorFactory factory_;
  ConnectorKind kind_ = ConnectorKind::kLegacy;
  std::string user_name_;
  std::unique_ptr<IShareConnector> connector_;
  ConnectionState state_ = ConnectionState::kNotConnected;
};

// Releases the session of a ShareConnection on scope exit, whichever path
// the capture takes. Move-only.
class ScopedShareDisconnect {
public:
  explicit ScopedShareDisconnect(ShareConnection* connection) : connection_(connection) {}
  ~ScopedShareDisconnect();

  ScopedShareDisconnect(const ScopedShareDisconnect&) = delete;
  ScopedShareDisconnect& operator=(const ScopedShareDisconnect&) = delete;
  ScopedShareDisconnect(ScopedShareDisconnect&& other) noexcept;
  ScopedShareDisconnect& operator=(ScopedShareDisconnect&& other) noexcept;

  // Disconnects now instead of at scope exit.
  void Release();

private:
  ShareConnection* connection_ = nullptr;
};

} // namespace dscapture::share
