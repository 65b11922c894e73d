#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace esphome {
namespace grobro {

// What to do with a received frame whose checksum does not match.
enum class CrcPolicy : uint8_t {
  LENIENT,  // log and keep decoding
  STRICT,   // drop the frame
};

enum class ChecksumStatus : uint8_t {
  OK,
  MISMATCH,
  MISSING,
};

const char *checksum_status_to_string(ChecksumStatus status);

// Why a message could not be decoded. Each failure is scoped to one message.
enum class DecodeError : uint8_t {
  NONE,
  MALFORMED_FRAME,   // length or bounds violation
  UNKNOWN_FUNCTION,  // function byte outside the known set
  NO_MATCH,          // valid frame, but a different message than asked for
};

const char *decode_error_to_string(DecodeError error);

// XOR every byte past the 8 byte header with the repeating "Growatt" key.
// Applying it twice restores the input. Frames shorter than the header are
// returned unchanged.
std::vector<uint8_t> scramble(const std::vector<uint8_t> &frame);
std::vector<uint8_t> descramble(const std::vector<uint8_t> &frame);

// Appends the CRC16-Modbus of the frame, most significant byte first.
std::vector<uint8_t> append_crc(const std::vector<uint8_t> &frame);
// Checks the trailing two byte CRC against the bytes before it.
bool verify_crc(const std::vector<uint8_t> &frame_with_crc);

// Outbound path: scramble the message body, then append the CRC.
std::vector<uint8_t> wrap_frame(const std::vector<uint8_t> &message);

// Inbound path: check the CRC according to the policy, strip the trailer and
// descramble. Returns nothing when the frame is too short to carry a header
// and a trailer, or when the policy rejects the checksum.
std::optional<std::vector<uint8_t>> unwrap_frame(const std::vector<uint8_t> &raw, CrcPolicy policy,
                                                 ChecksumStatus *status = nullptr);

// Big-endian field helpers shared by the codecs. Callers check bounds.
uint16_t read_uint16(const std::vector<uint8_t> &data, size_t offset);
uint32_t read_uint32(const std::vector<uint8_t> &data, size_t offset);
void append_uint16(std::vector<uint8_t> &data, uint16_t value);

// ASCII field with NUL padding removed. Bytes outside 7-bit ASCII are dropped.
std::string read_ascii(const std::vector<uint8_t> &data, size_t offset, size_t length);
// Writes the string NUL-padded (or truncated) to exactly `length` bytes.
void append_padded_ascii(std::vector<uint8_t> &data, const std::string &text, size_t length);

}  // namespace grobro
}  // namespace esphome
