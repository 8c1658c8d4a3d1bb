#include "share/share_connectors.hpp"

#include "core/string_utils.hpp"
#include "share/share_probe.hpp"

namespace dscapture::share {

std::string_view ToString(const ConnectorKind kind) {
  switch (kind) {
  case ConnectorKind::kLegacy:
    return "legacy share connector";
  case ConnectorKind::kModern:
    return "modern share connector";
  }
  return "unknown share connector";
}

ConnectorKind ResolveConnectorKind(std::string_view connector_type) {
  if (core::EqualsIgnoreCase(core::TrimAscii(connector_type), "dotnet")) {
    return ConnectorKind::kModern;
  }
  return ConnectorKind::kLegacy;
}

std::unique_ptr<IShareConnector> CreateShareConnector(const ConnectorKind kind) {
  if (kind == ConnectorKind::kModern) {
    return std::make_unique<ModernShareConnector>();
  }
  return std::make_unique<LegacyShareConnector>();
}

bool LegacyShareConnector::Connect(const std::string& share_path,
                                   const ShareCredentials& credentials,
                                   ConnectorFailure& failure) {
  failure = ConnectorFailure{};
  connected_ = false;

  if (credentials.password.empty()) {
    failure.code = kShareErrorLogonFailure;
    return false;
  }

  const ShareProbeResult probe = ProbeShare(share_path);
  if (!probe.reachable) {
    failure.code = probe.code;
    return false;
  }

  share_path_ = share_path;
  connected_ = true;
  return true;
}

void LegacyShareConnector::Disconnect() {
  connected_ = false;
  share_path_.clear();
}

bool ModernShareConnector::Connect(const std::string& share_path,
                                   const ShareCredentials& credentials,
                                   ConnectorFailure& failure) {
  failure = ConnectorFailure{};
  connected_ = false;

  std::string trimmed = share_path;
  if (!trimmed.empty() && (trimmed.back() == '\\' || trimmed.back() == '/')) {
    trimmed.pop_back();
  }

  if (credentials.password.empty()) {
    failure.message = "The user name or password is incorrect.";
    return false;
  }

  const ShareProbeResult probe = ProbeShare(trimmed);
  if (!probe.reachable) {
    failure.message = probe.message;
    return false;
  }

  share_path_ = std::move(trimmed);
  connected_ = true;
  return true;
}

void ModernShareConnector::Disconnect() {
  connected_ = false;
  share_path_.clear();
}

} // namespace dscapture::share
