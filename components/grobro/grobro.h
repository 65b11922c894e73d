// components/grobro/grobro.h
#pragma once

#include "esphome/core/component.h"
#include "esphome/core/log.h"
#include "esphome/core/helpers.h"

#include "grobro_command.h"
#include "grobro_config.h"
#include "grobro_constants.h"
#include "grobro_decoder.h"
#include "grobro_frame.h"
#include "grobro_modbus.h"
#include "grobro_registers.h"

#include <string>
#include <vector>

namespace esphome {
namespace grobro {

class GrobroSensor;
class GrobroTextSensor;
class GrobroNumber;
class GrobroSwitch;

// Bridge between the MQTT broker a Growatt datalogger reports to and the
// entities of one device. Decodes telemetry and configuration frames on
// c/<device_id> and sends commands on s/33/<device_id>.
class GrobroComponent : public Component {
 public:
  void setup() override;
  void dump_config() override;
  float get_setup_priority() const override { return setup_priority::AFTER_CONNECTION; }

  // Configuration
  void set_device_id(const std::string &device_id) { this->decoder_.set_device_id(device_id); }
  void set_subscribe_topic(const std::string &topic) { this->subscribe_topic_ = topic; }
  void set_command_topic_prefix(const std::string &prefix) { this->command_topic_prefix_ = prefix; }
  void set_strict_crc(bool strict) { this->decoder_.set_crc_policy(strict ? CrcPolicy::STRICT : CrcPolicy::LENIENT); }
  void set_device_timeout(uint32_t timeout_ms) { this->device_timeout_ = timeout_ms; }
  void set_sanity_limit(const std::string &register_key, float limit) {
    this->decoder_.set_sanity_limit(register_key, limit);
  }

  void register_sensor(GrobroSensor *sensor) { this->sensors_.push_back(sensor); }
  void register_text_sensor(GrobroTextSensor *sensor) { this->text_sensors_.push_back(sensor); }
  void register_number(GrobroNumber *number) { this->numbers_.push_back(number); }
  void register_switch(GrobroSwitch *sw) { this->switches_.push_back(sw); }

  const std::string &get_device_id() const { return this->decoder_.get_device_id(); }
  DeviceFamily get_family() const { return this->decoder_.get_catalog().get_family(); }
  const RegisterCatalog &get_catalog() const { return this->decoder_.get_catalog(); }

  // Scrambles, checksums and publishes the command. Returns false when the
  // MQTT client refused the message.
  bool send_command(const Command &command);

  // Entry point for one MQTT message, public for the test harness.
  void on_message(const std::string &topic, const std::string &payload);

 protected:
  void build_catalog_();
  void handle_config_(const DeviceConfig &config);
  void publish_registers_(const std::vector<DecodedRegister> &registers, bool holding);
  void refresh_timeout_();
  void mark_unavailable_();

  MessageDecoder decoder_;
  std::string subscribe_topic_{DEFAULT_SUBSCRIBE_TOPIC};
  std::string command_topic_prefix_{DEFAULT_COMMAND_TOPIC_PREFIX};
  uint32_t device_timeout_{0};

  DeviceConfig last_config_;
  uint32_t frames_received_{0};
  uint32_t frames_dropped_{0};

  std::vector<GrobroSensor *> sensors_;
  std::vector<GrobroTextSensor *> text_sensors_;
  std::vector<GrobroNumber *> numbers_;
  std::vector<GrobroSwitch *> switches_;
};

}  // namespace grobro
}  // namespace esphome
