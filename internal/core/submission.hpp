#pragma once

#include <optional>
#include <string>

namespace gate::core {

/*
  What arrived on the wire, before any verification.

  Each part may be missing. payload keeps the exact bytes received since
  that is what the miner signed.
*/
struct SubmissionEnvelope {
  std::optional<std::string> payload;
  std::optional<std::string> signature_hex;
  std::optional<std::string> artifact;
};

} // namespace gate::core
