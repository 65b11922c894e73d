#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace esphome {
namespace grobro {

struct ConfigParameter {
  uint16_t key_id{0};
  std::string name;
  std::string value;
  std::vector<uint8_t> raw;
};

// Device configuration as announced by the datalogger in TLV form.
// Keeps the announcement order. A later parameter with the same name
// replaces the earlier one.
class DeviceConfig {
 public:
  void set(const ConfigParameter &parameter);
  void set_raw(const std::string &raw_hex) { this->raw_ = raw_hex; }

  std::optional<std::string> get(const std::string &name) const;
  const std::vector<ConfigParameter> &parameters() const { return this->parameters_; }
  const std::optional<std::string> &raw() const { return this->raw_; }

  // The datalogger serial doubles as the MQTT device id.
  std::string device_id() const;

  bool empty() const { return this->parameters_.empty() && !this->raw_.has_value(); }

 protected:
  std::vector<ConfigParameter> parameters_;
  std::optional<std::string> raw_;
};

// Field name of a TLV key id, `param_<id>` for ids without a name.
std::string config_field_name(uint16_t key_id);
// Inverse of config_field_name, including the `param_<id>` form.
std::optional<uint16_t> config_key_id(const std::string &name);

// Parses TLV entries (2 byte key id, 2 byte length, value) from offset on.
// A zero or oversized length, or a value running past the buffer, ends the
// block. When no entry was parsed the remaining bytes are kept hex encoded as
// `raw`, so the result is never empty.
DeviceConfig parse_config(const std::vector<uint8_t> &data, size_t offset);

// The TLV block sits behind a preamble of varying length. Returns the first
// position from 0x1C on that looks like a plausible key/length pair, 0x1C if
// there is none.
size_t find_config_offset(const std::vector<uint8_t> &data);

// Serializes the parsed parameters back to TLV entries. The raw fallback has
// no TLV form and is not emitted.
std::vector<uint8_t> build_config(const DeviceConfig &config);

}  // namespace grobro
}  // namespace esphome
