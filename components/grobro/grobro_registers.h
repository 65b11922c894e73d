// components/grobro/grobro_registers.h
#pragma once

#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace esphome {
namespace grobro {

enum class DeviceFamily : uint8_t {
  UNKNOWN,
  NEO,   // micro inverter, serials start with QMN
  NOAH,  // balcony battery, serials start with 0PVP
  NEXA,  // battery, serials start with 0HVR
};

DeviceFamily detect_device_family(const std::string &device_id);
const char *device_family_to_string(DeviceFamily family);

// Where a value lives relative to the start register of a block.
struct RegisterPosition {
  uint16_t register_no{0};
  uint16_t offset{0};  // bytes into the register
  uint8_t size{2};     // 1, 2 or 4 bytes
};

enum class RegisterKind : uint8_t {
  FLOAT,
  ENUM,
  STRING,
};

enum class EnumKind : uint8_t {
  INT_MAP,
  BITFIELD,
};

// A decoded value. Numeric registers (floats and enum codes) carry a number,
// string registers carry text.
class RegisterValue {
 public:
  RegisterValue() = default;
  static RegisterValue from_number(double value);
  static RegisterValue from_text(const std::string &text);

  bool is_text() const { return this->is_text_; }
  double number() const { return this->number_; }
  const std::string &text() const { return this->text_; }
  std::string to_string() const;

  bool operator==(const RegisterValue &other) const;
  bool operator!=(const RegisterValue &other) const { return !(*this == other); }

 protected:
  bool is_text_{false};
  double number_{0.0};
  std::string text_;
};

// Decode rule of a register. Immutable once built.
class RegisterDataType {
 public:
  RegisterDataType() = default;
  static RegisterDataType make_float(double multiplier = 1.0, double delta = 0.0);
  static RegisterDataType make_enum(EnumKind enum_kind, const std::map<int64_t, std::string> &values);
  static RegisterDataType make_string();

  // Width comes from the slice length (1, 2 or 4 bytes, big-endian).
  // - FLOAT: raw * multiplier + delta, rounded to 3 decimals
  // - ENUM INT_MAP: the raw code if it is a known value, nothing otherwise
  // - ENUM BITFIELD: not supported, always nothing
  // - STRING: ASCII with NUL padding removed
  // An empty slice never decodes.
  std::optional<RegisterValue> decode(const std::vector<uint8_t> &raw) const;

  RegisterKind get_kind() const { return this->kind_; }
  EnumKind get_enum_kind() const { return this->enum_kind_; }
  double get_multiplier() const { return this->multiplier_; }
  double get_delta() const { return this->delta_; }
  const std::map<int64_t, std::string> &get_enum_values() const { return this->enum_values_; }
  // Label for an enum code, empty if the code is unknown.
  std::string enum_label(int64_t code) const;

 protected:
  RegisterKind kind_{RegisterKind::FLOAT};
  double multiplier_{1.0};
  double delta_{0.0};
  EnumKind enum_kind_{EnumKind::INT_MAP};
  std::map<int64_t, std::string> enum_values_;
};

// Home Assistant presentation of a register. Passed through, never
// interpreted by the codec.
struct DisplayInfo {
  std::string name;
  std::string unit;
  std::string icon;
  std::string entity_type;
  std::string device_class;
  std::string state_class;
  bool publish{true};
  float min_value{NAN};
  float max_value{NAN};
  float step{NAN};
};

struct RegisterDescriptor {
  RegisterPosition position;
  RegisterDataType data_type;
  DisplayInfo display;
};

struct DecodedRegister {
  std::string name;
  uint16_t register_no{0};
  std::string unit;
  RegisterValue value;
};

// Register map of one device family: read only telemetry (input registers)
// and settings (holding registers). Filled during setup, read only after.
class RegisterCatalog {
 public:
  using RegisterMap = std::map<std::string, RegisterDescriptor>;

  RegisterCatalog() = default;
  explicit RegisterCatalog(DeviceFamily family) : family_(family) {}

  void add_input_register(const std::string &name, const RegisterDescriptor &descriptor);
  void add_holding_register(const std::string &name, const RegisterDescriptor &descriptor);

  DeviceFamily get_family() const { return this->family_; }
  const RegisterMap &input_registers() const { return this->input_registers_; }
  const RegisterMap &holding_registers() const { return this->holding_registers_; }
  bool empty() const { return this->input_registers_.empty() && this->holding_registers_.empty(); }

  const RegisterDescriptor *find_input(const std::string &name) const;
  const RegisterDescriptor *find_holding(const std::string &name) const;
  // First holding register placed on the given register number.
  const RegisterDescriptor *find_holding_by_register(uint16_t register_no) const;

 protected:
  DeviceFamily family_{DeviceFamily::UNKNOWN};
  RegisterMap input_registers_;
  RegisterMap holding_registers_;
};

}  // namespace grobro
}  // namespace esphome
