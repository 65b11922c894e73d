// components/grobro/grobro_sensor.h
#pragma once

#include "esphome/components/sensor/sensor.h"
#include "esphome/components/text_sensor/text_sensor.h"
#include "esphome/core/log.h"

#include "grobro_config.h"
#include "grobro_entity.h"

#include <string>

namespace esphome {
namespace grobro {

// Numeric register value. Enum registers publish their code.
class GrobroSensor : public sensor::Sensor, public GrobroRegisterBinding {
 public:
  void update_value(const RegisterValue &value);
};

// Either a register (enum label or string) or a field of the device
// configuration, e.g. sw_version.
class GrobroTextSensor : public text_sensor::TextSensor, public GrobroRegisterBinding {
 public:
  void set_config_field(const std::string &field) { this->config_field_ = field; }
  const std::string &get_config_field() const { return this->config_field_; }
  bool is_config() const { return !this->config_field_.empty(); }

  void update_value(const RegisterValue &value);
  void update_config(const DeviceConfig &config);

 protected:
  std::string config_field_;
};

}  // namespace grobro
}  // namespace esphome
