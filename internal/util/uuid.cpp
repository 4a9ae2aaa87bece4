#include "uuid.hpp"

#include <random>

#include "internal/util/errors.hpp"

namespace jobq::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool IsDashPosition(std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

bool IsValidUUID(std::string_view str) {
  if (str.size() != 36) return false;
  for (std::size_t i = 0; i < str.size(); ++i) {
    if (IsDashPosition(i)) {
      if (str[i] != '-') return false;
    } else if (HexNibble(str[i]) < 0) {
      return false;
    }
  }
  return true;
}

UUID FromString(std::string_view str) {
  if (!IsValidUUID(str)) {
    throw InvalidArgument("invalid uuid: " + std::string(str));
  }

  UUID        id{};
  std::size_t byte = 0;
  for (std::size_t i = 0; i < str.size(); i += 2) {
    if (IsDashPosition(i)) ++i;
    id[byte++] = static_cast<uint8_t>((HexNibble(str[i]) << 4) | HexNibble(str[i + 1]));
  }
  return id;
}

} // namespace jobq::util
