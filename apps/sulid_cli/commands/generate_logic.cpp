#include "generate_logic.h"

#include "sulid/core/sulid_json.h"

#include <nlohmann/json.hpp>

namespace sulid::cli {

std::string validate_generate_config(const GenerateCliConfig& config) {
  if (config.parse_errors > 0) {
    return "Error: invalid arguments for generate (see messages above).";
  }

  if (config.version == core::SulidVersion::kV1) {
    if (config.worker_id.has_value()) {
      return "Error: --worker applies to --v2 only.\n"
             "       V1 identities use --data-center and --machine.";
    }
    if (config.data_center_id.value_or(0) > core::Sulid::kMaxDataCenterId) {
      return "Error: --data-center must be in the range 0-31.";
    }
    if (config.machine_id.value_or(0) > core::Sulid::kMaxMachineId) {
      return "Error: --machine must be in the range 0-31.";
    }
  } else {
    if (config.data_center_id.has_value() || config.machine_id.has_value()) {
      return "Error: --data-center and --machine apply to --v1 only.\n"
             "       V2 identities use --worker.";
    }
    if (config.worker_id.value_or(0) > core::Sulid::kMaxWorkerId) {
      return "Error: --worker must be in the range 0-1023.";
    }
  }

  if (config.count == 0 || config.count > kMaxCount) {
    return "Error: --count must be in the range 1-" + std::to_string(kMaxCount) + ".";
  }

  return "";
}

bool uses_default_identity(const GenerateCliConfig& config) {
  if (config.version == core::SulidVersion::kV1) {
    return !config.data_center_id.has_value() && !config.machine_id.has_value();
  }
  return !config.worker_id.has_value();
}

generator::WorkerIdentity build_identity(const GenerateCliConfig& config) {
  if (config.version == core::SulidVersion::kV1) {
    return generator::V1Identity{
        .data_center_id =
            static_cast<std::uint8_t>(config.data_center_id.value_or(kDefaultDataCenterId)),
        .machine_id = static_cast<std::uint8_t>(config.machine_id.value_or(kDefaultMachineId)),
    };
  }
  return generator::V2Identity{
      .worker_id = static_cast<std::uint16_t>(config.worker_id.value_or(kDefaultWorkerId)),
  };
}

int execute_generate(const GenerateCliConfig& config, generator::SulidGenerator& generator,
                     std::ostream& out) {
  nlohmann::json ids = nlohmann::json::array();
  for (unsigned i = 0; i < config.count; ++i) {
    const core::Sulid id = config.at_ms.has_value() ? generator.generate_at(config.at_ms.value())
                                                    : generator.generate();
    ids.push_back(core::sulid_to_json(id, generator.version()));
  }

  nlohmann::json result;
  result["ids"] = std::move(ids);
  out << result.dump(2) << "\n";
  return 0;
}

}  // namespace sulid::cli
