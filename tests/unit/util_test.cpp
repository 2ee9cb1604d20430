#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/fingerprint.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace {

bool IsLowerHex(const std::string& s) {
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

void TestIdsHavePrefixAndTwelveHexDigits() {
  const auto id = bay::util::NewSandboxId();
  assert(id.rfind("sandbox-", 0) == 0);
  assert(id.size() == std::string("sandbox-").size() + 12);
  assert(IsLowerHex(id.substr(8)));

  assert(bay::util::NewSessionId().rfind("sess-", 0) == 0);
  assert(bay::util::NewWorkspaceId().rfind("ws-", 0) == 0);
}

void TestIdsAreUnique() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    assert(seen.insert(bay::util::NewSandboxId()).second);
  }
}

void TestSha256KnownVectors() {
  assert(bay::util::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(bay::util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestFingerprintCoversMethodPathAndBody() {
  const auto base = bay::util::RequestFingerprint("POST", "/v1/sandboxes", "a");
  assert(base.size() == 64);
  assert(base == bay::util::Sha256Hex("POST:/v1/sandboxes:a"));
  assert(base == bay::util::RequestFingerprint("POST", "/v1/sandboxes", "a"));
  assert(base != bay::util::RequestFingerprint("PUT", "/v1/sandboxes", "a"));
  assert(base != bay::util::RequestFingerprint("POST", "/v1/sandboxes/x", "a"));
  assert(base != bay::util::RequestFingerprint("POST", "/v1/sandboxes", "b"));
}

void TestUnixMillisRoundTrip() {
  const uint64_t ms = 1'700'000'123'456ULL;
  assert(bay::util::ToUnixMillis(bay::util::FromUnixMillis(ms)) == ms);

  const auto ts = bay::util::MillisToProto(ms);
  assert(ts.seconds() == 1'700'000'123);
  assert(ts.nanos() == 456'000'000);
}

void TestLogFieldFormatting() {
  const auto managed = bay::observability::BoolField("managed", true);
  assert(managed.key == "managed");
  assert(managed.value == "true");
  assert(bay::observability::BoolField("managed", false).value == "false");

  const auto startup = bay::observability::DurationField("startup", std::chrono::milliseconds(1250));
  assert(startup.key == "startup");
  assert(startup.value == "1250ms");
  assert(bay::observability::IntField("attempts", -3).value == "-3");
}

} // namespace

int main() {
  TestIdsHavePrefixAndTwelveHexDigits();
  TestIdsAreUnique();
  TestSha256KnownVectors();
  TestFingerprintCoversMethodPathAndBody();
  TestUnixMillisRoundTrip();
  TestLogFieldFormatting();

  std::cout << "bay_unit_util: pass\n";
  return 0;
}
