#include "internal/http/multipart.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace gate::http {

namespace {

constexpr std::string_view kCrlf = "\r\n";

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Splits "a; b=c; d=\"e;f\"" on semicolons outside quotes.
std::vector<std::string_view> SplitParams(std::string_view value) {
  std::vector<std::string_view> out;
  bool                          quoted = false;
  size_t                        start  = 0;
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '"' && (i == 0 || value[i - 1] != '\\')) quoted = !quoted;
    if (value[i] == ';' && !quoted) {
      out.push_back(Trim(value.substr(start, i - start)));
      start = i + 1;
    }
  }
  out.push_back(Trim(value.substr(start)));
  return out;
}

std::string Unquote(std::string_view v) {
  if (v.size() < 2 || v.front() != '"' || v.back() != '"') return std::string(v);

  std::string out;
  v = v.substr(1, v.size() - 2);
  for (size_t i = 0; i < v.size(); ++i) {
    if (v[i] == '\\' && i + 1 < v.size()) ++i;
    out.push_back(v[i]);
  }
  return out;
}

// Value of `key` among the params after the first element.
std::optional<std::string> Param(const std::vector<std::string_view>& params, std::string_view key) {
  for (size_t i = 1; i < params.size(); ++i) {
    auto eq = params[i].find('=');
    if (eq == std::string_view::npos) continue;
    if (util::ToLowerAscii(Trim(params[i].substr(0, eq))) == key) {
      return Unquote(Trim(params[i].substr(eq + 1)));
    }
  }
  return std::nullopt;
}

void ParseHeaders(std::string_view block, FormPart& part) {
  bool has_disposition = false;

  while (!block.empty()) {
    auto        eol  = block.find(kCrlf);
    const auto  line = block.substr(0, eol);
    block            = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + kCrlf.size());

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw util::InvalidArgument("multipart: malformed part header");
    }
    const auto name  = util::ToLowerAscii(Trim(line.substr(0, colon)));
    const auto value = Trim(line.substr(colon + 1));

    if (name == "content-disposition") {
      auto params = SplitParams(value);
      if (util::ToLowerAscii(params.front()) != "form-data") {
        throw util::InvalidArgument("multipart: part is not form-data");
      }
      auto field = Param(params, "name");
      if (!field) throw util::InvalidArgument("multipart: part without a name");
      part.name       = std::move(*field);
      part.filename   = Param(params, "filename");
      has_disposition = true;
    } else if (name == "content-type") {
      part.content_type = std::string(value);
    }
  }

  if (!has_disposition) {
    throw util::InvalidArgument("multipart: part without Content-Disposition");
  }
}

} // namespace

std::optional<std::string> MultipartBoundary(std::string_view content_type) {
  auto params = SplitParams(content_type);
  if (util::ToLowerAscii(params.front()) != "multipart/form-data") return std::nullopt;

  auto boundary = Param(params, "boundary");
  if (!boundary || boundary->empty() || boundary->size() > 70) return std::nullopt;
  return boundary;
}

std::vector<FormPart> ParseMultipart(std::string_view body, std::string_view boundary) {
  const std::string delimiter = "--" + std::string(boundary);
  const std::string separator = std::string(kCrlf) + delimiter;

  // first delimiter: at offset 0 or after a preamble line
  size_t pos;
  if (body.substr(0, delimiter.size()) == delimiter) {
    pos = delimiter.size();
  } else {
    auto found = body.find(separator);
    if (found == std::string_view::npos) throw util::InvalidArgument("multipart: boundary not found");
    pos = found + separator.size();
  }

  std::vector<FormPart> parts;
  for (;;) {
    if (body.substr(pos, 2) == "--") {
      return parts; // close delimiter, epilogue ignored
    }

    // transport padding after the delimiter
    while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) ++pos;
    if (body.substr(pos, kCrlf.size()) != kCrlf) {
      throw util::InvalidArgument("multipart: expected CRLF after boundary");
    }
    pos += kCrlf.size();

    FormPart part;
    if (body.substr(pos, kCrlf.size()) == kCrlf) {
      throw util::InvalidArgument("multipart: part without headers");
    }
    auto headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string_view::npos) {
      throw util::InvalidArgument("multipart: unterminated part headers");
    }
    ParseHeaders(body.substr(pos, headers_end - pos), part);
    pos = headers_end + 4;

    auto next = body.find(separator, pos);
    if (next == std::string_view::npos) {
      throw util::InvalidArgument("multipart: missing closing boundary");
    }
    part.body = std::string(body.substr(pos, next - pos));
    parts.push_back(std::move(part));

    pos = next + separator.size();
  }
}

} // namespace gate::http
