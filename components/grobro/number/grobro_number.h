#pragma once

#include "esphome/components/number/number.h"
#include "esphome/core/component.h"

#include "../grobro_entity.h"

namespace esphome {
namespace grobro {

enum class NumberCommandType : uint8_t {
  PRESET_SINGLE_REGISTER,
  NEO_OUTPUT_POWER_LIMIT,
  NOAH_SMART_POWER,
  NOAH_SLOT1_POWER,
};

const char *number_command_type_to_string(NumberCommandType type);

// Writable setting. The state follows the holding register reported by the
// device; control() sends the matching command and publishes optimistically.
class GrobroNumber : public number::Number, public Component, public GrobroRegisterBinding {
 public:
  void set_command_type(NumberCommandType type) { this->command_type_ = type; }
  NumberCommandType get_command_type() const { return this->command_type_; }

  void setup() override;
  void dump_config() override;

  void update_value(const RegisterValue &value);

 protected:
  void control(float value) override;

  NumberCommandType command_type_{NumberCommandType::PRESET_SINGLE_REGISTER};
};

}  // namespace grobro
}  // namespace esphome
