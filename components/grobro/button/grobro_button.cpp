#include "grobro_button.h"
#include "../grobro.h"

#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.button";

void GrobroButton::dump_config() {
  LOG_BUTTON("", "Grobro Button", this);
  if (this->command_type_ == ButtonCommandType::READ_SINGLE_REGISTER) {
    ESP_LOGCONFIG(TAG, "  Reads register %u", this->register_no_);
  } else {
    ESP_LOGCONFIG(TAG, "  Reads the NEO output power limit");
  }
}

void GrobroButton::press_action() {
  if (this->parent_ == nullptr) {
    ESP_LOGW(TAG, "Button '%s' has no parent", this->get_name().c_str());
    return;
  }
  const std::string &device_id = this->parent_->get_device_id();
  Command command = ReadSingleRegister{device_id, this->register_no_};
  if (this->command_type_ == ButtonCommandType::NEO_READ_OUTPUT_POWER_LIMIT)
    command = NeoReadOutputPowerLimit{device_id};
  if (!this->parent_->send_command(command))
    ESP_LOGW(TAG, "Button '%s': request not sent", this->get_name().c_str());
}

}  // namespace grobro
}  // namespace esphome
