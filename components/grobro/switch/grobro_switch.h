#pragma once

#include "esphome/components/switch/switch.h"
#include "esphome/core/component.h"

#include "../grobro_entity.h"

namespace esphome {
namespace grobro {

// Holding register that reads 1 for on. Writes 1 or 0 with a single
// register preset.
class GrobroSwitch : public switch_::Switch, public Component, public GrobroRegisterBinding {
 public:
  void setup() override;
  void dump_config() override;

  void update_value(const RegisterValue &value);

 protected:
  void write_state(bool state) override;
};

}  // namespace grobro
}  // namespace esphome
