#include "inspect_logic.h"

#include "sulid/core/config.h"
#include "sulid/core/sulid.h"
#include "sulid/core/sulid_json.h"
#include "sulid/core/version.h"

#include <nlohmann/json.hpp>

#include <optional>

namespace sulid::cli {

namespace {

// Both layouts read the same bits; show each so the caller can pick.
nlohmann::json describe(const core::Sulid& id) {
  auto v1 = core::sulid_to_json(id, core::SulidVersion::kV1);
  auto v2 = core::sulid_to_json(id, core::SulidVersion::kV2);

  nlohmann::json out;
  out["id"] = v1["id"];
  out["random_hex"] = v1["random_hex"];
  out["timestamp_ms"] = v1["timestamp_ms"];
  out["nil"] = id.is_nil();
  out["v1"] = {{"data_center_id", v1["data_center_id"]}, {"machine_id", v1["machine_id"]}};
  out["v2"] = {{"worker_id", v2["worker_id"]}};
  return out;
}

std::optional<core::Sulid> parse_or_report(const std::string& text, std::ostream& err) {
  const auto decoded = core::Sulid::from_string(text);
  if (!decoded.has_value()) {
    err << "Error: cannot decode '" << text << "': " << core::to_string(decoded.error()) << "\n";
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace

int execute_decode(const std::string& text, std::ostream& out, std::ostream& err) {
  const auto id = parse_or_report(text, err);
  if (!id.has_value()) {
    return kExitError;
  }
  out << describe(id.value()).dump(2) << "\n";
  return kExitOk;
}

int execute_increment(const std::string& text, std::ostream& out, std::ostream& err) {
  const auto id = parse_or_report(text, err);
  if (!id.has_value()) {
    return kExitError;
  }

  const auto next = id->increment();
  if (!next.has_value()) {
    nlohmann::json result;
    result["exhausted"] = true;
    result["id"] = text;
    out << result.dump(2) << "\n";
    return kExitExhausted;
  }

  out << describe(next.value()).dump(2) << "\n";
  return kExitOk;
}

int execute_nil(std::ostream& out) {
  out << describe(core::Sulid::nil()).dump(2) << "\n";
  return kExitOk;
}

int execute_config(std::ostream& out) {
  nlohmann::json result;
  result["version"] = core::kBuildVersion;
  result["full_profile"] = core::kFullProfile;
  result["shared_rng"] = core::kSharedRng;
  result["strict_assert"] = core::kStrictAssert;
  result["summary"] = core::build_config_summary();
  out << result.dump(2) << "\n";
  return kExitOk;
}

}  // namespace sulid::cli
