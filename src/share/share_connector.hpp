#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace dscapture::share {

enum class ConnectorKind {
  // Reports failures as numeric OS error codes.
  kLegacy,
  // Reports failures as message text.
  kModern,
};

std::string_view ToString(ConnectorKind kind);

struct ShareCredentials {
  std::string user;
  std::string password;
};

// Failure details from one connect attempt. Legacy connectors set `code`;
// modern connectors set `message`.
struct ConnectorFailure {
  int code = 0;
  std::string message;
};

// Session strategy for a credentialed network share.
//
// Contract:
// - Connect establishes a session usable by subsequent filesystem calls
// - Disconnect releases it and is safe to call when nothing is open
class IShareConnector {
public:
  virtual ~IShareConnector() = default;

  virtual ConnectorKind Kind() const = 0;

  virtual bool Connect(const std::string& share_path, const ShareCredentials& credentials,
                       ConnectorFailure& failure) = 0;

  virtual void Disconnect() = 0;
};

// `connector_type` "dotnet" (any case) selects the modern connector; every
// other value, including empty, selects the legacy connector.
ConnectorKind ResolveConnectorKind(std::string_view connector_type);

std::unique_ptr<IShareConnector> CreateShareConnector(ConnectorKind kind);

} // namespace dscapture::share
