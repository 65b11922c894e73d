// components/grobro/grobro.cpp
#include "grobro.h"
#include "grobro_sensor.h"
#include "number/grobro_number.h"
#include "switch/grobro_switch.h"

#include "esphome/components/mqtt/mqtt_client.h"

#include <cmath>

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro";

void GrobroComponent::setup() {
  ESP_LOGCONFIG(TAG, "Setting up Grobro...");

  const std::string &device_id = this->decoder_.get_device_id();
  if (device_id.empty()) {
    ESP_LOGE(TAG, "Device id not configured");
    this->mark_failed();
    return;
  }

  if (this->get_family() == DeviceFamily::UNKNOWN) {
    ESP_LOGE(TAG, "Unrecognized device prefix: %s", device_id.c_str());
    this->mark_failed();
    return;
  }
  this->build_catalog_();

  if (mqtt::global_mqtt_client == nullptr) {
    ESP_LOGE(TAG, "MQTT client not configured");
    this->mark_failed();
    return;
  }

  mqtt::global_mqtt_client->subscribe(
      this->subscribe_topic_,
      [this](const std::string &topic, const std::string &payload) { this->on_message(topic, payload); }, 0);
  ESP_LOGD(TAG, "Subscribed to %s", this->subscribe_topic_.c_str());
}

void GrobroComponent::build_catalog_() {
  RegisterCatalog &catalog = this->decoder_.get_catalog();
  for (auto *sensor : this->sensors_) {
    auto descriptor = sensor->build_descriptor(sensor->get_name(), "sensor");
    descriptor.display.unit = sensor->get_unit_of_measurement();
    if (sensor->is_holding()) {
      if (catalog.find_holding(sensor->get_register_key()) == nullptr)
        catalog.add_holding_register(sensor->get_register_key(), descriptor);
    } else if (catalog.find_input(sensor->get_register_key()) == nullptr) {
      catalog.add_input_register(sensor->get_register_key(), descriptor);
    }
  }
  for (auto *sensor : this->text_sensors_) {
    if (sensor->is_config())
      continue;
    auto descriptor = sensor->build_descriptor(sensor->get_name(), "text_sensor");
    if (sensor->is_holding()) {
      if (catalog.find_holding(sensor->get_register_key()) == nullptr)
        catalog.add_holding_register(sensor->get_register_key(), descriptor);
    } else if (catalog.find_input(sensor->get_register_key()) == nullptr) {
      catalog.add_input_register(sensor->get_register_key(), descriptor);
    }
  }
  for (auto *number : this->numbers_) {
    if (number->get_register_key().empty())
      continue;
    auto descriptor = number->build_descriptor(number->get_name(), "number");
    descriptor.display.min_value = number->traits.get_min_value();
    descriptor.display.max_value = number->traits.get_max_value();
    descriptor.display.step = number->traits.get_step();
    catalog.add_holding_register(number->get_register_key(), descriptor);
  }
  for (auto *sw : this->switches_) {
    catalog.add_holding_register(sw->get_register_key(), sw->build_descriptor(sw->get_name(), "switch"));
  }
}

void GrobroComponent::dump_config() {
  ESP_LOGCONFIG(TAG, "Grobro:");
  if (this->is_failed()) {
    ESP_LOGCONFIG(TAG, "  Status: FAILED");
    return;
  }
  ESP_LOGCONFIG(TAG, "  Device: %s (%s)", this->get_device_id().c_str(), device_family_to_string(this->get_family()));
  ESP_LOGCONFIG(TAG, "  Subscribe Topic: %s", this->subscribe_topic_.c_str());
  ESP_LOGCONFIG(TAG, "  Command Topic: %s%s", this->command_topic_prefix_.c_str(), this->get_device_id().c_str());
  ESP_LOGCONFIG(TAG, "  CRC: %s", this->decoder_.get_crc_policy() == CrcPolicy::STRICT ? "strict" : "lenient");
  if (this->device_timeout_ > 0)
    ESP_LOGCONFIG(TAG, "  Device Timeout: %.1fs", this->device_timeout_ / 1000.0f);
  for (auto const &[key, limit] : this->decoder_.get_sanity_limits())
    ESP_LOGCONFIG(TAG, "  Sanity Limit: %s > %.0f", key.c_str(), limit);

  const RegisterCatalog &catalog = this->get_catalog();
  ESP_LOGCONFIG(TAG, "  Input Registers: %u", (unsigned) catalog.input_registers().size());
  for (auto const &[name, descriptor] : catalog.input_registers())
    ESP_LOGCONFIG(TAG, "    %s: reg %u +%u (%u bytes)", name.c_str(), descriptor.position.register_no,
                  descriptor.position.offset, descriptor.position.size);
  ESP_LOGCONFIG(TAG, "  Holding Registers: %u", (unsigned) catalog.holding_registers().size());
  for (auto const &[name, descriptor] : catalog.holding_registers())
    ESP_LOGCONFIG(TAG, "    %s: reg %u (%s)", name.c_str(), descriptor.position.register_no,
                  descriptor.display.entity_type.c_str());

  for (auto *sensor : this->sensors_)
    LOG_SENSOR("  ", "Sensor", sensor);
  for (auto *sensor : this->text_sensors_)
    LOG_TEXT_SENSOR("  ", "Text Sensor", sensor);
}

void GrobroComponent::on_message(const std::string &topic, const std::string &payload) {
  std::vector<uint8_t> raw(payload.begin(), payload.end());
  DecodedMessage message = this->decoder_.decode(topic, raw);
  if (message.outcome == DecodeOutcome::IGNORED || message.outcome == DecodeOutcome::UNKNOWN_DEVICE)
    return;

  this->frames_received_++;
  switch (message.outcome) {
    case DecodeOutcome::DROPPED:
      this->frames_dropped_++;
      break;
    case DecodeOutcome::INPUT_REGISTERS:
      if (message.timestamp.has_value())
        ESP_LOGV(TAG, "Telemetry of %s taken at %s", message.device_id.c_str(), message.timestamp->c_str());
      this->publish_registers_(message.registers, false);
      this->refresh_timeout_();
      break;
    case DecodeOutcome::HOLDING_REGISTERS:
      if (message.power_limit.has_value())
        ESP_LOGI(TAG, "Output power limit of %s: %u%%", message.power_limit->device_id.c_str(),
                 message.power_limit->value);
      this->publish_registers_(message.registers, true);
      break;
    case DecodeOutcome::WRITE_ACK:
      ESP_LOGD(TAG, "Write acknowledged by %s", message.device_id.c_str());
      break;
    case DecodeOutcome::CONFIG:
      this->handle_config_(message.config);
      break;
    default:
      break;
  }
}

void GrobroComponent::publish_registers_(const std::vector<DecodedRegister> &registers, bool holding) {
  for (auto const &reg : registers) {
    ESP_LOGV(TAG, "%s = %s %s", reg.name.c_str(), reg.value.to_string().c_str(), reg.unit.c_str());
    for (auto *sensor : this->sensors_) {
      if (sensor->is_holding() == holding && sensor->get_register_key() == reg.name)
        sensor->update_value(reg.value);
    }
    for (auto *sensor : this->text_sensors_) {
      if (!sensor->is_config() && sensor->is_holding() == holding && sensor->get_register_key() == reg.name)
        sensor->update_value(reg.value);
    }
    if (!holding)
      continue;
    for (auto *number : this->numbers_) {
      if (number->get_register_key() == reg.name)
        number->update_value(reg.value);
    }
    for (auto *sw : this->switches_) {
      if (sw->get_register_key() == reg.name)
        sw->update_value(reg.value);
    }
  }
}

void GrobroComponent::handle_config_(const DeviceConfig &config) {
  this->last_config_ = config;
  ESP_LOGI(TAG, "Received config message for %s (%u parameters)", this->get_device_id().c_str(),
           (unsigned) this->last_config_.parameters().size());
  for (auto const &parameter : this->last_config_.parameters())
    ESP_LOGD(TAG, "  %s: %s", parameter.name.c_str(), parameter.value.c_str());

  for (auto *sensor : this->text_sensors_) {
    if (sensor->is_config())
      sensor->update_config(this->last_config_);
  }
}

bool GrobroComponent::send_command(const Command &command) {
  if (this->is_failed() || mqtt::global_mqtt_client == nullptr) {
    ESP_LOGW(TAG, "Cannot send %s, component not ready", command_name(command));
    return false;
  }
  std::string topic = this->command_topic_prefix_ + command_device_id(command);
  auto frame = wrap_frame(build_command(command));
  ESP_LOGD(TAG, "Sending %s to %s: %s", command_name(command), topic.c_str(), format_hex_pretty(frame).c_str());
  if (!mqtt::global_mqtt_client->publish(topic, reinterpret_cast<const char *>(frame.data()), frame.size())) {
    ESP_LOGW(TAG, "Publishing %s failed", command_name(command));
    return false;
  }
  return true;
}

void GrobroComponent::refresh_timeout_() {
  if (this->device_timeout_ == 0)
    return;
  this->set_timeout("device_timeout", this->device_timeout_, [this]() { this->mark_unavailable_(); });
}

void GrobroComponent::mark_unavailable_() {
  ESP_LOGW(TAG, "No telemetry from %s for %.1fs (%u frames received, %u dropped)", this->get_device_id().c_str(),
           this->device_timeout_ / 1000.0f, this->frames_received_, this->frames_dropped_);
  for (auto *sensor : this->sensors_) {
    if (!sensor->is_holding())
      sensor->publish_state(NAN);
  }
}

}  // namespace grobro
}  // namespace esphome
