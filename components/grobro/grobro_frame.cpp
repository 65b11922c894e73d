#include "grobro_frame.h"
#include "grobro_constants.h"

#include "esphome/core/helpers.h"
#include "esphome/core/log.h"

#include <algorithm>

namespace esphome {
namespace grobro {

static const char *const TAG = "grobro.frame";

const char *checksum_status_to_string(ChecksumStatus status) {
  switch (status) {
    case ChecksumStatus::OK:
      return "OK";
    case ChecksumStatus::MISMATCH:
      return "MISMATCH";
    case ChecksumStatus::MISSING:
      return "MISSING";
    default:
      return "UNKNOWN";
  }
}

const char *decode_error_to_string(DecodeError error) {
  switch (error) {
    case DecodeError::NONE:
      return "NONE";
    case DecodeError::MALFORMED_FRAME:
      return "MALFORMED_FRAME";
    case DecodeError::UNKNOWN_FUNCTION:
      return "UNKNOWN_FUNCTION";
    case DecodeError::NO_MATCH:
      return "NO_MATCH";
    default:
      return "UNKNOWN";
  }
}

std::vector<uint8_t> scramble(const std::vector<uint8_t> &frame) {
  std::vector<uint8_t> out(frame);
  for (size_t i = HEADER_SIZE; i < out.size(); i++) {
    out[i] ^= static_cast<uint8_t>(SCRAMBLE_KEY[(i - HEADER_SIZE) % SCRAMBLE_KEY_LENGTH]);
  }
  return out;
}

std::vector<uint8_t> descramble(const std::vector<uint8_t> &frame) { return scramble(frame); }

std::vector<uint8_t> append_crc(const std::vector<uint8_t> &frame) {
  std::vector<uint8_t> out(frame);
  uint16_t crc = crc16(frame.data(), static_cast<uint16_t>(frame.size()));
  append_uint16(out, crc);
  return out;
}

bool verify_crc(const std::vector<uint8_t> &frame_with_crc) {
  if (frame_with_crc.size() < CRC_SIZE)
    return false;
  size_t body_len = frame_with_crc.size() - CRC_SIZE;
  uint16_t received_crc = read_uint16(frame_with_crc, body_len);
  uint16_t calculated_crc = crc16(frame_with_crc.data(), static_cast<uint16_t>(body_len));
  return received_crc == calculated_crc;
}

std::vector<uint8_t> wrap_frame(const std::vector<uint8_t> &message) { return append_crc(scramble(message)); }

std::optional<std::vector<uint8_t>> unwrap_frame(const std::vector<uint8_t> &raw, CrcPolicy policy,
                                                 ChecksumStatus *status) {
  if (raw.size() < HEADER_SIZE + CRC_SIZE) {
    ESP_LOGW(TAG, "Frame too short: %u bytes", (unsigned) raw.size());
    if (status != nullptr)
      *status = ChecksumStatus::MISSING;
    return {};
  }

  ChecksumStatus checksum = verify_crc(raw) ? ChecksumStatus::OK : ChecksumStatus::MISMATCH;
  if (status != nullptr)
    *status = checksum;

  if (checksum == ChecksumStatus::MISMATCH) {
    size_t body_len = raw.size() - CRC_SIZE;
    uint16_t received_crc = read_uint16(raw, body_len);
    uint16_t calculated_crc = crc16(raw.data(), static_cast<uint16_t>(body_len));
    if (policy == CrcPolicy::STRICT) {
      ESP_LOGW(TAG, "CRC mismatch! Received: 0x%04X, Calculated: 0x%04X. Dropping frame.", received_crc,
               calculated_crc);
      return {};
    }
    ESP_LOGW(TAG, "CRC mismatch! Received: 0x%04X, Calculated: 0x%04X. Continuing anyway.", received_crc,
             calculated_crc);
  }

  std::vector<uint8_t> body(raw.begin(), raw.end() - CRC_SIZE);
  return descramble(body);
}

uint16_t read_uint16(const std::vector<uint8_t> &data, size_t offset) {
  return encode_uint16(data[offset], data[offset + 1]);
}

uint32_t read_uint32(const std::vector<uint8_t> &data, size_t offset) {
  return encode_uint32(data[offset], data[offset + 1], data[offset + 2], data[offset + 3]);
}

void append_uint16(std::vector<uint8_t> &data, uint16_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  data.push_back(static_cast<uint8_t>(value & 0xFF));
}

std::string read_ascii(const std::vector<uint8_t> &data, size_t offset, size_t length) {
  std::string text;
  if (offset >= data.size())
    return text;
  size_t end = std::min(data.size(), offset + length);
  text.reserve(end - offset);
  for (size_t i = offset; i < end; i++) {
    if (data[i] < 0x80)
      text.push_back(static_cast<char>(data[i]));
  }
  size_t first = text.find_first_not_of('\0');
  if (first == std::string::npos)
    return "";
  size_t last = text.find_last_not_of('\0');
  return text.substr(first, last - first + 1);
}

void append_padded_ascii(std::vector<uint8_t> &data, const std::string &text, size_t length) {
  for (size_t i = 0; i < length; i++) {
    data.push_back(i < text.size() ? static_cast<uint8_t>(text[i]) : 0x00);
  }
}

}  // namespace grobro
}  // namespace esphome
