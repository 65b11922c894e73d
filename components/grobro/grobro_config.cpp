#include "grobro_config.h"
#include "grobro_constants.h"
#include "grobro_frame.h"

#include "esphome/core/helpers.h"
#include "esphome/core/log.h"

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.config";

struct ConfigKey {
  uint16_t id;
  const char *name;
};

static const ConfigKey CONFIG_KEYS[] = {
    {4, "data_interval"},    {5, "unknown_5"},       {6, "unknown_6"},         {7, "password"},
    {8, "serial_number"},    {9, "protocol_version"}, {10, "unknown_10"},      {11, "unknown_11"},
    {12, "dns_address"},     {13, "device_type"},     {14, "local_ip"},        {15, "unknown_port"},
    {16, "mac_address"},     {17, "remote_ip"},       {18, "remote_port"},     {19, "remote_url"},
    {20, "model_id"},        {21, "sw_version"},      {22, "hw_version"},      {23, "unknown_23"},
    {24, "unknown_24"},      {25, "subnet_mask"},     {26, "default_gateway"}, {27, "unknown_27"},
    {28, "unknown_28"},      {29, "unknown_29"},      {30, "timezone"},        {31, "datetime"},
    {76, "wifi_signal"},
};

static const char PARAM_PREFIX[] = "param_";

void DeviceConfig::set(const ConfigParameter &parameter) {
  for (auto &existing : this->parameters_) {
    if (existing.name == parameter.name) {
      existing = parameter;
      return;
    }
  }
  this->parameters_.push_back(parameter);
}

std::optional<std::string> DeviceConfig::get(const std::string &name) const {
  for (auto const &parameter : this->parameters_) {
    if (parameter.name == name)
      return parameter.value;
  }
  if (name == "raw")
    return this->raw_;
  return {};
}

std::string DeviceConfig::device_id() const { return this->get("serial_number").value_or(""); }

std::string config_field_name(uint16_t key_id) {
  for (auto const &key : CONFIG_KEYS) {
    if (key.id == key_id)
      return key.name;
  }
  return str_sprintf("%s%u", PARAM_PREFIX, key_id);
}

std::optional<uint16_t> config_key_id(const std::string &name) {
  for (auto const &key : CONFIG_KEYS) {
    if (name == key.name)
      return key.id;
  }
  if (!str_startswith(name, PARAM_PREFIX))
    return {};
  auto id = parse_number<uint16_t>(name.substr(sizeof(PARAM_PREFIX) - 1));
  if (!id.has_value())
    return {};
  return *id;
}

// Printable ASCII after stripping NUL padding, nothing otherwise.
static std::optional<std::string> decode_printable(const std::vector<uint8_t> &raw) {
  std::string text(raw.begin(), raw.end());
  size_t first = text.find_first_not_of('\0');
  if (first == std::string::npos)
    return std::string();
  size_t last = text.find_last_not_of('\0');
  text = text.substr(first, last - first + 1);
  for (char c : text) {
    auto byte = static_cast<uint8_t>(c);
    if (byte < 0x20 || byte > 0x7E)
      return {};
  }
  return text;
}

DeviceConfig parse_config(const std::vector<uint8_t> &data, size_t offset) {
  DeviceConfig config;
  const size_t end = data.size();
  const size_t start = offset;
  bool any_params = false;

  while (offset + 4 <= end) {
    uint16_t key_id = read_uint16(data, offset);
    uint16_t key_len = read_uint16(data, offset + 2);
    offset += 4;

    // A zero length doubles as end marker.
    if (key_len == 0 || key_len > CONFIG_MAX_VALUE_LENGTH || offset + key_len > end)
      break;

    ConfigParameter parameter;
    parameter.key_id = key_id;
    parameter.name = config_field_name(key_id);
    parameter.raw.assign(data.begin() + offset, data.begin() + offset + key_len);
    offset += key_len;

    auto text = decode_printable(parameter.raw);
    parameter.value = text.has_value() ? *text : format_hex(parameter.raw);

    ESP_LOGV(TAG, "TLV %u (%s) = %s", key_id, parameter.name.c_str(), parameter.value.c_str());
    config.set(parameter);
    any_params = true;
  }

  if (!any_params) {
    std::vector<uint8_t> rest;
    if (start < end)
      rest.assign(data.begin() + start, data.end());
    ESP_LOGD(TAG, "No TLV parameters found at offset %u, keeping %u raw bytes", (unsigned) start,
             (unsigned) rest.size());
    config.set_raw(format_hex(rest));
  }

  return config;
}

size_t find_config_offset(const std::vector<uint8_t> &data) {
  for (size_t i = CONFIG_SCAN_START; i + 4 < data.size(); i++) {
    uint16_t key = read_uint16(data, i);
    uint16_t length = read_uint16(data, i + 2);
    if (key > 0 && key < CONFIG_MAX_SCAN_KEY && length > 0 && length < CONFIG_MAX_SCAN_LENGTH)
      return i;
  }
  return CONFIG_SCAN_START;
}

std::vector<uint8_t> build_config(const DeviceConfig &config) {
  std::vector<uint8_t> data;
  for (auto const &parameter : config.parameters()) {
    append_uint16(data, parameter.key_id);
    append_uint16(data, static_cast<uint16_t>(parameter.raw.size()));
    data.insert(data.end(), parameter.raw.begin(), parameter.raw.end());
  }
  return data;
}

}  // namespace grobro
}  // namespace esphome
