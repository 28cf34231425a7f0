#include "sulid/core/sulid_json.h"

#include "sulid/codec/bytes.h"

#include <stdexcept>
#include <string>

namespace sulid::core {

nlohmann::json sulid_to_json(const Sulid& id, const SulidVersion version) {
  codec::EncodedBuffer buffer{};

  nlohmann::json j;
  j["id"] = std::string(id.encode_into(buffer));
  j["random_hex"] = codec::to_hex(id.random());
  j["timestamp_ms"] = id.timestamp_ms();
  j["version"] = sulid_version_to_string(version);

  switch (version) {
    case SulidVersion::kV1:
      j["data_center_id"] = id.data_center_id();
      j["machine_id"] = id.machine_id();
      break;
    case SulidVersion::kV2:
      j["worker_id"] = id.worker_id();
      break;
  }
  return j;
}

Sulid sulid_from_json(const nlohmann::json& j) {
  const auto text = j.at("id").get<std::string>();
  const auto decoded = Sulid::from_string(text);
  if (!decoded.has_value()) {
    throw std::invalid_argument("Invalid sulid '" + text + "': " + to_string(decoded.error()));
  }
  return decoded.value();
}

}  // namespace sulid::core
