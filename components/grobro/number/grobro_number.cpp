#include "grobro_number.h"
#include "../grobro.h"

#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.number";

const char *number_command_type_to_string(NumberCommandType type) {
  switch (type) {
    case NumberCommandType::PRESET_SINGLE_REGISTER:
      return "preset_single_register";
    case NumberCommandType::NEO_OUTPUT_POWER_LIMIT:
      return "neo_output_power_limit";
    case NumberCommandType::NOAH_SMART_POWER:
      return "noah_smart_power";
    case NumberCommandType::NOAH_SLOT1_POWER:
      return "noah_slot1_power";
    default:
      return "unknown";
  }
}

void GrobroNumber::setup() {
  if (this->parent_ == nullptr) {
    ESP_LOGE(TAG, "Parent component not set for number '%s'", this->get_name().c_str());
    this->mark_failed();
    return;
  }
  if (this->command_type_ == NumberCommandType::PRESET_SINGLE_REGISTER && this->position_.register_no == 0) {
    ESP_LOGE(TAG, "Register not set for number '%s'", this->get_name().c_str());
    this->mark_failed();
  }
}

void GrobroNumber::dump_config() {
  LOG_NUMBER("", "Grobro Number", this);
  ESP_LOGCONFIG(TAG, "  Command: %s", number_command_type_to_string(this->command_type_));
  if (!this->register_key_.empty())
    ESP_LOGCONFIG(TAG, "  Register: %s (%u)", this->register_key_.c_str(), this->position_.register_no);
}

void GrobroNumber::update_value(const RegisterValue &value) {
  if (value.is_text())
    return;
  this->publish_state(static_cast<float>(value.number()));
}

void GrobroNumber::control(float value) {
  const std::string &device_id = this->parent_->get_device_id();
  Command command;

  switch (this->command_type_) {
    case NumberCommandType::PRESET_SINGLE_REGISTER: {
      auto raw = this->to_raw(value);
      if (!raw.has_value()) {
        ESP_LOGW(TAG, "'%s': %.3f does not fit register %u", this->get_name().c_str(), value,
                 this->position_.register_no);
        return;
      }
      command = PresetSingleRegister{device_id, this->position_.register_no, *raw};
      break;
    }
    case NumberCommandType::NEO_OUTPUT_POWER_LIMIT:
    case NumberCommandType::NOAH_SLOT1_POWER: {
      auto word = to_command_word(value);
      if (!word.has_value()) {
        ESP_LOGW(TAG, "'%s': invalid value", this->get_name().c_str());
        return;
      }
      if (this->command_type_ == NumberCommandType::NEO_OUTPUT_POWER_LIMIT) {
        command = NeoSetOutputPowerLimit{device_id, *word};
      } else {
        command = make_noah_slot1_power(device_id, *word);
      }
      break;
    }
    case NumberCommandType::NOAH_SMART_POWER: {
      auto diff = to_power_diff(value);
      if (!diff.has_value()) {
        ESP_LOGW(TAG, "'%s': invalid value", this->get_name().c_str());
        return;
      }
      command = NoahSmartPower{device_id, *diff};
      break;
    }
  }

  ESP_LOGI(TAG, "Setting '%s' to %.3f", this->get_name().c_str(), value);
  if (!this->parent_->send_command(command))
    return;
  this->publish_state(value);
}

}  // namespace grobro
}  // namespace esphome
