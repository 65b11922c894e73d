#include "grobro_switch.h"
#include "../grobro.h"

#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.switch";

void GrobroSwitch::setup() {
  if (this->parent_ == nullptr) {
    ESP_LOGE(TAG, "Parent component not set for switch '%s'", this->get_name().c_str());
    this->mark_failed();
    return;
  }
  if (this->position_.register_no == 0) {
    ESP_LOGE(TAG, "Register not set for switch '%s'", this->get_name().c_str());
    this->mark_failed();
  }
}

void GrobroSwitch::dump_config() {
  LOG_SWITCH("", "Grobro Switch", this);
  ESP_LOGCONFIG(TAG, "  Register: %s (%u)", this->register_key_.c_str(), this->position_.register_no);
}

void GrobroSwitch::update_value(const RegisterValue &value) {
  if (value.is_text())
    return;
  bool new_state = value.number() == 1;
  if (new_state != this->state)
    ESP_LOGD(TAG, "Switch '%s' changed: %s", this->get_name().c_str(), ONOFF(new_state));
  this->publish_state(new_state);
}

void GrobroSwitch::write_state(bool state) {
  PresetSingleRegister command{this->parent_->get_device_id(), this->position_.register_no,
                               static_cast<uint16_t>(state ? 1 : 0)};
  ESP_LOGI(TAG, "Writing '%s': %s (register %u)", this->get_name().c_str(), ONOFF(state),
           this->position_.register_no);
  if (!this->parent_->send_command(command))
    return;
  this->publish_state(state);
}

}  // namespace grobro
}  // namespace esphome
