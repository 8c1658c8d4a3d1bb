#pragma once

#include "share/share_connector.hpp"

#include <string>

namespace dscapture::share {

// Numeric-code connector. Failure codes follow the OS network error table
// in share_probe.hpp.
class LegacyShareConnector final : public IShareConnector {
public:
  ConnectorKind Kind() const override {
    return ConnectorKind::kLegacy;
  }

  bool Connect(const std::string& share_path, const ShareCredentials& credentials,
               ConnectorFailure& failure) override;
  void Disconnect() override;

  bool connected() const {
    return connected_;
  }

private:
  bool connected_ = false;
  std::string share_path_;
};

// Message-based connector. A trailing path separator on the share path is
// removed before connecting.
class ModernShareConnector final : public IShareConnector {
public:
  ConnectorKind Kind() const override {
    return ConnectorKind::kModern;
  }

  bool Connect(const std::string& share_path, const ShareCredentials& credentials,
               ConnectorFailure& failure) override;
  void Disconnect() override;

  bool connected() const {
    return connected_;
  }

  const std::string& share_path() const {
    return share_path_;
  }

private:
  bool connected_ = false;
  std::string share_path_;
};

} // namespace dscapture::share
