#pragma once

#include <boost/beast/http.hpp>

#include <memory>

#include "internal/service/submission_service.hpp"

namespace gate::http {

namespace beast_http = boost::beast::http;

using Request  = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

/*
  HTTP surface of the gate.

    GET  /get_task  -> TaskInfo JSON
    POST /submit    -> {"status": ..., "reason": ...}, always 200

  Transport problems (not multipart, unknown route, handler exception) get
  a 4xx/5xx with {"error": ...}; they never reach the pipeline.
*/
class HttpHandler {
 public:
  explicit HttpHandler(std::shared_ptr<service::SubmissionService> service);

  // Blocking: runs the pipeline on the calling thread. Never throws.
  Response Handle(const Request& req) const;

  static Response ErrorResponse(const Request& req, beast_http::status status, std::string_view message);

 private:
  Response Submit(const Request& req) const;
  Response GetTask(const Request& req) const;

  std::shared_ptr<service::SubmissionService> service_;
};

} // namespace gate::http
