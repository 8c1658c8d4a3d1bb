#include "params/params_loader.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

namespace dscapture::params {

namespace {

using JsonValue = core::json::Value;

bool LoadSection(const JsonValue& root, std::string_view section, bool required, ParamSet& out,
                 std::string& error) {
  const JsonValue* object = core::json::FindMember(root, section);
  if (object == nullptr) {
    if (required) {
      error = "missing required object '" + std::string(section) + "'";
      return false;
    }
    return true;
  }
  if (object->type != JsonValue::Type::kObject) {
    error = "'" + std::string(section) + "' must be an object";
    return false;
  }

  for (const auto& [key, value] : object->object_value) {
    std::string text;
    if (!core::json::ScalarToString(value, text)) {
      error = "parameter '" + std::string(section) + "." + key +
              "' must be a string, number, or boolean";
      return false;
    }
    out.SetParam(key, std::move(text));
  }
  return true;
}

} // namespace

bool LoadParamsFromText(std::string_view json_text, CaptureParams& params, std::string& error) {
  params = CaptureParams{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid params JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "params root must be a JSON object";
    return false;
  }

  if (!LoadSection(root, "task", true, params.task, error)) {
    return false;
  }
  return LoadSection(root, "manager", false, params.manager, error);
}

bool LoadParamsFile(const std::filesystem::path& path, CaptureParams& params, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  return LoadParamsFromText(text, params, error);
}

} // namespace dscapture::params
