#pragma once

#include "sulid/core/sulid.h"

#include <nlohmann/json.hpp>

namespace sulid::core {

// Deterministic JSON view of an identifier.
// Keys are sorted alphabetically (nlohmann::json uses std::map internally).
//
// Shape for kV1:
//   {"data_center_id": 1, "id": "<26 chars>", "machine_id": 1,
//    "random_hex": "<32 hex digits>", "timestamp_ms": 1717000000000, "version": "v1"}
// Shape for kV2 replaces data_center_id/machine_id with "worker_id".
//
// random_hex is a string because JSON numbers cannot hold 70 bits exactly.
[[nodiscard]] nlohmann::json sulid_to_json(const Sulid& id, SulidVersion version);

// Read an identifier back from its JSON view. Only "id" is consulted; the
// derived fields are informational.
// Throws nlohmann::json::exception when "id" is missing or not a string, and
// std::invalid_argument when it does not decode.
[[nodiscard]] Sulid sulid_from_json(const nlohmann::json& j);

}  // namespace sulid::core
