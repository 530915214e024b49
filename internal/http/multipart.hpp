#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gate::http {

/*
  multipart/form-data (RFC 7578) decoding.

  Part bodies are kept byte-for-byte; nothing is trimmed or re-encoded.
*/

struct FormPart {
  std::string                name;
  std::optional<std::string> filename;
  std::string                content_type;
  std::string                body;
};

// Boundary parameter of a multipart/form-data Content-Type, nullopt for
// any other media type or a missing boundary.
std::optional<std::string> MultipartBoundary(std::string_view content_type);

// Throws util::InvalidArgument on a malformed body.
std::vector<FormPart> ParseMultipart(std::string_view body, std::string_view boundary);

} // namespace gate::http
