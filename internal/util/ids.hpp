#pragma once

#include <string>
#include <string_view>

namespace bay::util {

/*
  Resource identifiers.

  Format is "<prefix>-<12 lowercase hex>", e.g. "sandbox-3f9a0c12be47".
*/

std::string GenerateId(std::string_view prefix);

std::string NewSandboxId();
std::string NewSessionId();
std::string NewWorkspaceId();

} // namespace bay::util
