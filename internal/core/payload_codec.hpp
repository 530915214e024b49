#pragma once

#include <optional>
#include <string_view>

#include "gate/v1/submission.pb.h"

namespace gate::core {

// nullopt unless the text is a JSON object carrying all seven fields with
// the right types and a finite performance. Keys are matched exactly and
// unknown fields are ignored.
std::optional<gate::v1::SubmissionPayload> ParsePayload(std::string_view json);

} // namespace gate::core
