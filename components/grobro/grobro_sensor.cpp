// components/grobro/grobro_sensor.cpp
#include "grobro_sensor.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.sensor";

void GrobroSensor::update_value(const RegisterValue &value) {
  if (value.is_text()) {
    ESP_LOGW(TAG, "Sensor '%s' (reg %u): got text '%s', expected a number", this->get_name().c_str(),
             this->position_.register_no, value.text().c_str());
    return;
  }
  ESP_LOGV(TAG, "Sensor '%s' (reg %u): %s", this->get_name().c_str(), this->position_.register_no,
           value.to_string().c_str());
  this->publish_state(static_cast<float>(value.number()));
}

void GrobroTextSensor::update_value(const RegisterValue &value) {
  if (value.is_text()) {
    this->publish_state(value.text());
    return;
  }
  auto label = this->get_data_type().enum_label(static_cast<int64_t>(value.number()));
  this->publish_state(label.empty() ? value.to_string() : label);
}

void GrobroTextSensor::update_config(const DeviceConfig &config) {
  auto value = config.get(this->config_field_);
  if (!value.has_value()) {
    ESP_LOGV(TAG, "Config field '%s' not announced", this->config_field_.c_str());
    return;
  }
  this->publish_state(*value);
}

}  // namespace grobro
}  // namespace esphome
