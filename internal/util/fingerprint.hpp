#pragma once

#include <string>
#include <string_view>

namespace bay::util {

// Lowercase hex SHA-256 of the input.
std::string Sha256Hex(std::string_view data);

// Request fingerprint used by the idempotency ledger: SHA-256 of "METHOD:path:body".
std::string RequestFingerprint(std::string_view method, std::string_view path, std::string_view body);

} // namespace bay::util
