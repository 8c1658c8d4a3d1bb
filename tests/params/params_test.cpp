#include "params/param_set.hpp"
#include "params/params_loader.hpp"
#include "params/password.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using dscapture::params::CaptureParams;
using dscapture::params::ParamSet;

TEST_CASE("parameter keys are case-insensitive", "[params]") {
  ParamSet params;
  params.SetParam("Storage_Path", "Lumos01/2020_3");
  REQUIRE(params.HasParam("storage_path"));
  REQUIRE(params.GetString("STORAGE_PATH") == "Lumos01/2020_3");
  REQUIRE(params.GetString("missing", "fallback") == "fallback");

  params.SetParam("storage_path", "Lumos01/2021_1");
  REQUIRE(params.size() == 1U);
  REQUIRE(params.GetString("Storage_Path") == "Lumos01/2021_1");
}

TEST_CASE("typed getters fall back on bad values", "[params]") {
  ParamSet params;
  params.SetParam("sleepinterval", "45");
  params.SetParam("bad_int", "forty");
  params.SetParam("AllowIncompleteDataset", "True");
  params.SetParam("flag_no", "no");

  REQUIRE(params.GetInt("SleepInterval", 30) == 45);
  REQUIRE(params.GetInt("bad_int", 30) == 30);
  REQUIRE(params.GetInt("absent", 7) == 7);
  REQUIRE(params.GetBool("allowincompletedataset", false));
  REQUIRE_FALSE(params.GetBool("flag_no", true));
  REQUIRE(params.GetBool("absent", true));
}

TEST_CASE("params JSON normalizes scalars to strings", "[params][json]") {
  CaptureParams params;
  std::string error;
  REQUIRE(dscapture::params::LoadParamsFromText(
      R"({"task":{"Dataset":"QC_Shew_20_01","Job":1234,"AllowIncompleteDataset":true},
          "manager":{"sleepinterval":30}})",
      params, error));
  REQUIRE(params.task.GetString("Dataset") == "QC_Shew_20_01");
  REQUIRE(params.task.GetString("Job") == "1234");
  REQUIRE(params.task.GetBool("AllowIncompleteDataset", false));
  REQUIRE(params.manager.GetInt("sleepinterval", 0) == 30);
}

TEST_CASE("params JSON rejects nested values and missing task", "[params][json]") {
  CaptureParams params;
  std::string error;
  REQUIRE_FALSE(dscapture::params::LoadParamsFromText(R"({"task":{"Dataset":["a"]}})", params, error));
  REQUIRE(error == "parameter 'task.Dataset' must be a string, number, or boolean");

  REQUIRE_FALSE(dscapture::params::LoadParamsFromText(R"({"manager":{}})", params, error));
  REQUIRE(error == "missing required object 'task'");

  REQUIRE_FALSE(dscapture::params::LoadParamsFromText("[1,2]", params, error));
  REQUIRE(error == "params root must be a JSON object");
}

TEST_CASE("share password decoding reverses the alternating shift", "[params][password]") {
  REQUIRE(dscapture::params::DecodePassword("`c") == "ab");
  REQUIRE(dscapture::params::EncodePassword("ab") == "`c");
  REQUIRE(dscapture::params::DecodePassword(dscapture::params::EncodePassword("Secret#42")) ==
          "Secret#42");
  REQUIRE(dscapture::params::DecodePassword("").empty());
}
