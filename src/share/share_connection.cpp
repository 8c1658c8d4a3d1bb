#include "share/share_connection.hpp"

#include "core/logging/logger.hpp"
#include "core/path_utils.hpp"
#include "outcome/outcome_classifier.hpp"
#include "share/share_probe.hpp"

#include <utility>

namespace dscapture::share {

namespace {

bool IsSessionLossCode(const int code) {
  return code == kShareErrorSessionCredentialConflict || code == kShareErrorNoNetwork ||
         code == kShareErrorBadNetPath || code == kShareErrorNetNameDeleted;
}

} // namespace

std::string_view ToString(const ConnectionState state) {
  switch (state) {
  case ConnectionState::kNotConnected:
    return "not_connected";
  case ConnectionState::kConnectedViaLegacy:
    return "connected_legacy";
  case ConnectionState::kConnectedViaModern:
    return "connected_modern";
  }
  return "not_connected";
}

std::string NormalizeUserName(std::string_view user, std::string_view host_name) {
  if (user.find('\\') != std::string_view::npos) {
    return std::string(user);
  }
  return std::string(host_name) + "\\" + std::string(user);
}

ShareConnection::ShareConnection(ShareConnectionSettings settings, core::logging::Logger& logger)
    : ShareConnection(std::move(settings), logger, &CreateShareConnector) {}

ShareConnection::ShareConnection(ShareConnectionSettings settings, core::logging::Logger& logger,
                                 ConnectorFactory factory)
    : settings_(std::move(settings)), logger_(logger), factory_(std::move(factory)) {
  kind_ = ResolveConnectorKind(settings_.connector_type);
  user_name_ = NormalizeUserName(settings_.user, settings_.host_name);
}

ShareConnection::~ShareConnection() {
  Disconnect();
}

ShareConnectResult ShareConnection::Connect(const std::string& share_path) {
  if (state_ != ConnectionState::kNotConnected) {
    Disconnect();
  }

  connector_ = factory_(kind_);
  if (!connector_) {
    ShareConnectResult result;
    result.error = outcome::CaptureOutcome::Failed("No share connector available for " +
                                                   std::string(share::ToString(kind_)));
    return result;
  }

  const std::string local_path =
      core::ToLocalPath(share_path, settings_.unc_mount_root).string();
  const ShareCredentials credentials{user_name_, settings_.password};

  ConnectorFailure failure;
  if (!connector_->Connect(local_path, credentials, failure)) {
    connector_.reset();
    if (kind_ == ConnectorKind::kModern) {
      return FailModern(share_path, failure.message);
    }
    return FailLegacy(share_path, failure.code);
  }

  state_ = kind_ == ConnectorKind::kModern ? ConnectionState::kConnectedViaModern
                                           : ConnectionState::kConnectedViaLegacy;
  logger_.Debug("Connected to Bionet",
                {{"share", share_path},
                 {"user", user_name_},
                 {"connector", share::ToString(kind_)}});

  ShareConnectResult result;
  result.state = state_;
  return result;
}

ShareConnectResult ShareConnection::FailLegacy(const std::string& share_path, const int code) {
  std::string message = "Error " + std::to_string(code) + " connecting to " + share_path +
                        " as user " + user_name_ + " using 'secfso'";
  if (code == kShareErrorLogonFailure) {
    message += "; you likely need to change the Capture_Method from secfso to fso";
  }
  if (code == kShareErrorBadNetPath) {
    message += "; the password may need to be reset";
  }
  logger_.Error(message, {{"error_code", std::to_string(code)}});

  ShareConnectResult result;
  if (IsSessionLossCode(code)) {
    result.error = outcome::CaptureOutcome{outcome::Closeout::kAbortAllProcessing,
                                           outcome::RetryEligibility::kRetryEligibleNetworkError,
                                           message};
  } else {
    result.error = outcome::CaptureOutcome::Failed(message);
  }
  return result;
}

ShareConnectResult ShareConnection::FailModern(const std::string& share_path,
                                               const std::string& message) {
  const std::string closeout_message =
      "Error connecting to " + share_path + " as user " + user_name_ + " (using " +
      std::string(share::ToString(kind_)) + ")";
  logger_.Error(closeout_message, {{"error", message}});

  ShareConnectResult result;
  result.error = outcome::Classify(outcome::CaptureFault{message, closeout_message});
  return result;
}

void ShareConnection::Disconnect() {
  if (state_ == ConnectionState::kNotConnected) {
    return;
  }
  if (connector_) {
    connector_->Disconnect();
    connector_.reset();
  }
  state_ = ConnectionState::kNotConnected;
  logger_.Debug("Bionet disconnected");
}

std::string ShareConnection::ConnectionDescription() const {
  switch (state_) {
  case ConnectionState::kNotConnected:
    return " as user " + (settings_.local_user.empty() ? std::string("-") : settings_.local_user) +
           " using fso";
  case ConnectionState::kConnectedViaLegacy:
  case ConnectionState::kConnectedViaModern:
    return " as user " + user_name_ + " using " + std::string(share::ToString(kind_));
  }
  return " via unknown connection mode";
}

ScopedShareDisconnect::~ScopedShareDisconnect() {
  Release();
}

ScopedShareDisconnect::ScopedShareDisconnect(ScopedShareDisconnect&& other) noexcept
    : connection_(std::exchange(other.connection_, nullptr)) {}

ScopedShareDisconnect& ScopedShareDisconnect::operator=(ScopedShareDisconnect&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  connection_ = std::exchange(other.connection_, nullptr);
  return *this;
}

void ScopedShareDisconnect::Release() {
  if (connection_ == nullptr) {
    return;
  }
  connection_->Disconnect();
  connection_ = nullptr;
}

} // namespace dscapture::share
