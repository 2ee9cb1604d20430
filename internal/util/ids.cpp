#include "ids.hpp"

#include <cstdint>
#include <random>

namespace bay::util {

std::string GenerateId(std::string_view prefix) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char               kHex[] = "0123456789abcdef";

  uint64_t bits = rng();

  std::string id(prefix);
  id.push_back('-');
  for (int i = 0; i < 12; ++i) {
    id.push_back(kHex[bits & 0x0F]);
    bits >>= 4;
  }
  return id;
}

std::string NewSandboxId() {
  return GenerateId("sandbox");
}

std::string NewSessionId() {
  return GenerateId("sess");
}

std::string NewWorkspaceId() {
  return GenerateId("ws");
}

} // namespace bay::util
