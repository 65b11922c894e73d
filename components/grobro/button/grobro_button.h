#pragma once

#include "esphome/components/button/button.h"
#include "esphome/core/component.h"

#include <cstdint>

namespace esphome {
namespace grobro {

class GrobroComponent;

enum class ButtonCommandType : uint8_t {
  READ_SINGLE_REGISTER,
  NEO_READ_OUTPUT_POWER_LIMIT,
};

// Asks the device to report a register. The answer arrives as a regular
// register message and updates the bound entities.
class GrobroButton : public button::Button, public Component {
 public:
  void set_parent(GrobroComponent *parent) { this->parent_ = parent; }
  void set_command_type(ButtonCommandType type) { this->command_type_ = type; }
  void set_register_no(uint16_t register_no) { this->register_no_ = register_no; }

  void dump_config() override;

 protected:
  void press_action() override;

  GrobroComponent *parent_{nullptr};
  ButtonCommandType command_type_{ButtonCommandType::READ_SINGLE_REGISTER};
  uint16_t register_no_{0};
};

}  // namespace grobro
}  // namespace esphome
