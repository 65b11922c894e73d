#pragma once

#include "grobro_command.h"
#include "grobro_config.h"
#include "grobro_frame.h"
#include "grobro_modbus.h"
#include "grobro_registers.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace esphome {
namespace grobro {

enum class DecodeOutcome : uint8_t {
  IGNORED,         // message of another device
  UNKNOWN_DEVICE,  // serial prefix of no known family
  DROPPED,         // failed the checksum, framing or sanity checks
  INPUT_REGISTERS,
  HOLDING_REGISTERS,
  WRITE_ACK,
  CONFIG,
  UNHANDLED,  // well formed, but nothing to do with it
};

const char *decode_outcome_to_string(DecodeOutcome outcome);

struct DecodedMessage {
  DecodeOutcome outcome{DecodeOutcome::IGNORED};
  std::string device_id;
  std::vector<DecodedRegister> registers;
  std::optional<std::string> timestamp;
  std::optional<NeoOutputPowerLimit> power_limit;
  DeviceConfig config;
};

// Last path segment of c/<device_id>.
std::string topic_device_id(const std::string &topic);

// Turns the MQTT messages of one device into register and config updates.
class MessageDecoder {
 public:
  // Also selects the register catalog family from the serial prefix.
  void set_device_id(const std::string &device_id);
  void set_crc_policy(CrcPolicy policy) { this->crc_policy_ = policy; }
  // Drops a whole telemetry message when the register exceeds the limit.
  void set_sanity_limit(const std::string &register_key, float limit) { this->sanity_limits_[register_key] = limit; }

  const std::string &get_device_id() const { return this->device_id_; }
  CrcPolicy get_crc_policy() const { return this->crc_policy_; }
  const std::map<std::string, float> &get_sanity_limits() const { return this->sanity_limits_; }
  RegisterCatalog &get_catalog() { return this->catalog_; }
  const RegisterCatalog &get_catalog() const { return this->catalog_; }

  DecodedMessage decode(const std::string &topic, const std::vector<uint8_t> &payload) const;

 protected:
  void decode_modbus_(const std::vector<uint8_t> &frame, DecodedMessage &result) const;
  bool exceeds_sanity_limit_(const std::vector<DecodedRegister> &registers) const;

  std::string device_id_;
  CrcPolicy crc_policy_{CrcPolicy::LENIENT};
  std::map<std::string, float> sanity_limits_{{"Ppv", 1000000.0f}};
  RegisterCatalog catalog_;
};

}  // namespace grobro
}  // namespace esphome
