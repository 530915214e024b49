#include "internal/http/http_handler.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/http/multipart.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gate::http {

namespace {

constexpr const char* kServerName = "submission-gate";

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("response serialization failed: " + std::string(status.message()));
  }
  return json;
}

std::string JsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += ' ';
        } else {
          out += c;
        }
    }
  }
  return out;
}

Response JsonResponse(const Request& req, beast_http::status status, std::string body) {
  Response res{status, req.version()};
  res.set(beast_http::field::server, kServerName);
  res.set(beast_http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

std::string_view Path(const Request& req) {
  std::string_view target(req.target().data(), req.target().size());
  auto             query = target.find('?');
  return query == std::string_view::npos ? target : target.substr(0, query);
}

} // namespace

HttpHandler::HttpHandler(std::shared_ptr<service::SubmissionService> service) : service_(std::move(service)) {
}

Response HttpHandler::ErrorResponse(const Request& req, beast_http::status status, std::string_view message) {
  return JsonResponse(req, status, "{\"error\":\"" + JsonEscape(message) + "\"}");
}

Response HttpHandler::Handle(const Request& req) const {
  const auto path = Path(req);

  try {
    if (path == "/submit") {
      if (req.method() != beast_http::verb::post) {
        return ErrorResponse(req, beast_http::status::method_not_allowed, "use POST");
      }
      return Submit(req);
    }

    if (path == "/get_task") {
      if (req.method() != beast_http::verb::get) {
        return ErrorResponse(req, beast_http::status::method_not_allowed, "use GET");
      }
      return GetTask(req);
    }

    return ErrorResponse(req, beast_http::status::not_found, "no such route");
  } catch (const util::InvalidArgument& e) {
    return ErrorResponse(req, beast_http::status::bad_request, e.what());
  } catch (const std::exception& e) {
    GATE_LOG_ERROR("request handler failed", {observability::StringField("path", path), observability::StringField("error", e.what())});
    return ErrorResponse(req, beast_http::status::internal_server_error, "internal error");
  }
}

Response HttpHandler::Submit(const Request& req) const {
  const auto content_type = req[beast_http::field::content_type];
  const auto boundary     = MultipartBoundary(std::string_view(content_type.data(), content_type.size()));
  if (!boundary) {
    throw util::InvalidArgument("expected multipart/form-data");
  }

  core::SubmissionEnvelope envelope;
  for (auto& part : ParseMultipart(req.body(), *boundary)) {
    if (part.name == "payload") {
      envelope.payload = std::move(part.body);
    } else if (part.name == "signature") {
      envelope.signature_hex = std::move(part.body);
    } else if (part.name == "artifact") {
      envelope.artifact = std::move(part.body);
    }
  }

  return JsonResponse(req, beast_http::status::ok, ToJson(service_->Submit(envelope)));
}

Response HttpHandler::GetTask(const Request& req) const {
  return JsonResponse(req, beast_http::status::ok, ToJson(service_->GetTask()));
}

} // namespace gate::http
