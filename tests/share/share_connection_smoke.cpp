#include "../common/assertions.hpp"
#include "core/logging/logger.hpp"
#include "share/share_connection.hpp"
#include "share/share_probe.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace {

using dscapture::share::ConnectorFailure;
using dscapture::share::ConnectorKind;
using dscapture::share::ShareCredentials;

struct ConnectorScript {
  bool succeed = true;
  int code = 0;
  std::string message;
  int connects = 0;
  int disconnects = 0;
  std::string last_path;
  std::string last_user;
};

class ScriptedConnector final : public dscapture::share::IShareConnector {
public:
  ScriptedConnector(ConnectorKind kind, ConnectorScript& script) : kind_(kind), script_(script) {}

  ConnectorKind Kind() const override {
    return kind_;
  }

  bool Connect(const std::string& share_path, const ShareCredentials& credentials,
               ConnectorFailure& failure) override {
    ++script_.connects;
    script_.last_path = share_path;
    script_.last_user = credentials.user;
    if (script_.succeed) {
      return true;
    }
    failure.code = script_.code;
    failure.message = script_.message;
    return false;
  }

  void Disconnect() override {
    ++script_.disconnects;
  }

private:
  ConnectorKind kind_;
  ConnectorScript& script_;
};

dscapture::share::ConnectorFactory MakeFactory(ConnectorScript& script) {
  return [&script](ConnectorKind kind) {
    return std::make_unique<ScriptedConnector>(kind, script);
  };
}

dscapture::share::ShareConnectionSettings MakeSettings(const std::string& connector_type) {
  dscapture::share::ShareConnectionSettings settings;
  settings.connector_type = connector_type;
  settings.user = "svc-capture";
  settings.password = "secret";
  settings.host_name = "WORKER07";
  settings.local_user = "capture";
  settings.unc_mount_root = "/mnt";
  return settings;
}

void AssertSessionReleasedOnScopeExit() {
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kDebug, log);
  ConnectorScript script;
  dscapture::share::ShareConnection connection(MakeSettings(""), logger, MakeFactory(script));

  dscapture::tests::common::AssertEqual(connection.ConnectionDescription(),
                                        " as user capture using fso", "idle description");
  {
    dscapture::share::ScopedShareDisconnect guard(&connection);
    const dscapture::share::ShareConnectResult result =
        connection.Connect("\\\\proto-5\\Inst01\\");
    dscapture::tests::common::AssertTrue(result.connected(), "expected legacy connect to succeed");
    dscapture::tests::common::AssertEqual(script.last_path, "/mnt/proto-5/Inst01", "mapped share");
    dscapture::tests::common::AssertEqual(script.last_user, "WORKER07\\svc-capture", "user name");
    dscapture::tests::common::AssertEqual(
        connection.ConnectionDescription(),
        " as user WORKER07\\svc-capture using legacy share connector", "connected description");
  }

  dscapture::tests::common::AssertTrue(script.disconnects == 1, "guard must disconnect once");
  dscapture::tests::common::AssertTrue(
      connection.state() == dscapture::share::ConnectionState::kNotConnected,
      "connection must be idle after guard exit");

  // Repeated disconnects are no-ops.
  connection.Disconnect();
  dscapture::tests::common::AssertTrue(script.disconnects == 1, "disconnect must be idempotent");
  dscapture::tests::common::AssertContains(log.str(), "Bionet disconnected");
}

void AssertLegacySessionLossAborts() {
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kInfo, log);
  ConnectorScript script;
  script.succeed = false;
  script.code = dscapture::share::kShareErrorSessionCredentialConflict;
  dscapture::share::ShareConnection connection(MakeSettings("legacy"), logger,
                                               MakeFactory(script));

  const dscapture::share::ShareConnectResult result = connection.Connect("\\\\proto-5\\Inst01");
  dscapture::tests::common::AssertTrue(!result.connected(), "expected connect failure");
  dscapture::tests::common::AssertTrue(result.error.has_value(), "expected a closeout");
  dscapture::tests::common::AssertTrue(result.error->must_stop_accepting_work(),
                                       "1219 must abort all processing");
  dscapture::tests::common::AssertContains(result.error->message, "Error 1219 connecting to");
}

void AssertLegacyLogonFailureHint() {
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kInfo, log);
  ConnectorScript script;
  script.succeed = false;
  script.code = dscapture::share::kShareErrorLogonFailure;
  dscapture::share::ShareConnection connection(MakeSettings(""), logger, MakeFactory(script));

  const dscapture::share::ShareConnectResult result = connection.Connect("\\\\proto-5\\Inst01");
  dscapture::tests::common::AssertTrue(result.error.has_value(), "expected a closeout");
  dscapture::tests::common::AssertTrue(
      result.error->closeout == dscapture::outcome::Closeout::kFailed, "1326 must fail the job");
  dscapture::tests::common::AssertContains(result.error->message,
                                           "change the Capture_Method from secfso to fso");
}

void AssertModernFailureIsClassifiedFromText() {
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kInfo, log);
  ConnectorScript script;
  script.succeed = false;
  script.message = "The user name or password is incorrect.";
  dscapture::share::ShareConnection connection(MakeSettings("DotNET"), logger, MakeFactory(script));
  dscapture::tests::common::AssertTrue(connection.connector_kind() == ConnectorKind::kModern,
                                       "DotNET selects the modern connector");

  const dscapture::share::ShareConnectResult result = connection.Connect("\\\\proto-5\\Inst01");
  dscapture::tests::common::AssertTrue(result.error.has_value(), "expected a closeout");
  dscapture::tests::common::AssertTrue(
      result.error->retry == dscapture::outcome::RetryEligibility::kRetryEligibleNetworkError,
      "credential rejection is retry eligible");
  dscapture::tests::common::AssertEqual(result.error->message,
                                        "Authentication failure: The user name or password is "
                                        "incorrect.",
                                        "modern failure message");
}

} // namespace

int main() {
  AssertSessionReleasedOnScopeExit();
  AssertLegacySessionLossAborts();
  AssertLegacyLogonFailureHint();
  AssertModernFailureIsClassifiedFromText();
  return 0;
}
