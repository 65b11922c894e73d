// components/grobro/grobro_entity.h
#pragma once

#include "grobro_registers.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace esphome {
namespace grobro {

class GrobroComponent;

// Register an entity is bound to. The YAML schema fills it through the
// setters; the hub turns it into a catalog entry during setup.
class GrobroRegisterBinding {
 public:
  void set_parent(GrobroComponent *parent) { this->parent_ = parent; }
  // Catalog name of the register, e.g. "Ppv"
  void set_register_key(const std::string &key) { this->register_key_ = key; }
  void set_holding(bool holding) { this->holding_ = holding; }
  void set_register_no(uint16_t register_no) { this->position_.register_no = register_no; }
  void set_offset(uint16_t offset) { this->position_.offset = offset; }
  void set_size(uint8_t size) { this->position_.size = size; }
  void set_multiplier(float multiplier) { this->multiplier_ = multiplier; }
  void set_delta(float delta) { this->delta_ = delta; }
  void add_enum_value(int64_t code, const std::string &label) { this->enum_values_[code] = label; }
  void set_bitfield(bool bitfield) { this->bitfield_ = bitfield; }
  void set_string(bool is_string) { this->string_ = is_string; }

  const std::string &get_register_key() const { return this->register_key_; }
  bool is_holding() const { return this->holding_; }
  const RegisterPosition &get_position() const { return this->position_; }

  RegisterDataType get_data_type() const;
  RegisterDescriptor build_descriptor(const std::string &name, const char *entity_type) const;

  // Raw register word for an entity state, the inverse of the float rule.
  // Nothing when the result does not fit a register.
  std::optional<uint16_t> to_raw(float value) const;

 protected:
  GrobroComponent *parent_{nullptr};
  std::string register_key_;
  bool holding_{false};
  RegisterPosition position_;
  float multiplier_{1.0f};
  float delta_{0.0f};
  std::map<int64_t, std::string> enum_values_;
  bool bitfield_{false};
  bool string_{false};
};

}  // namespace grobro
}  // namespace esphome
