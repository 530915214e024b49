#include "internal/http/http_handler.hpp"

#include "internal/cache/memory/memory_replay_store.hpp"
#include "internal/core/submission_pipeline.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/submission_service.hpp"
#include "internal/util/hex.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

namespace ed         = gate::crypto::ed25519;
namespace beast_http = boost::beast::http;

using gate::http::Request;
using gate::http::Response;

constexpr int64_t kNow = 1'700'000'000;

struct Stack {
  std::shared_ptr<gate::db::memory::MemoryRepository> repo = std::make_shared<gate::db::memory::MemoryRepository>();
  ed::KeyPair                                         keys = ed::GenerateKeyPair();
  std::shared_ptr<gate::service::SubmissionService>   service;
  std::shared_ptr<gate::service::AdminService>        admin;
  std::unique_ptr<gate::http::HttpHandler>            handler;

  Stack() {
    gate::core::PipelineContext ctx;
    ctx.replay_store = std::make_shared<gate::cache::memory::MemoryReplayStore>();
    ctx.repository   = repo;
    ctx.now_unix_sec = [] { return kNow; };

    gate::service::ServiceContext svc;
    svc.pipeline   = std::make_shared<gate::core::SubmissionPipeline>(ctx);
    svc.repository = repo;
    svc.default_task.set_task_id("task-prod-001");
    svc.default_task.set_performance_threshold(0.5);
    svc.default_task.set_validation_data_hash("00ff");

    service = std::make_shared<gate::service::SubmissionService>(svc);
    admin   = std::make_shared<gate::service::AdminService>(svc);
    handler = std::make_unique<gate::http::HttpHandler>(service);

    admin->RegisterMiner(7, gate::util::HexEncode(keys.public_key));
  }
};

std::string Part(const std::string& name, const std::string& body) {
  return "--XyZ\r\nContent-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" + body + "\r\n";
}

Request SubmitRequest(const std::string& body) {
  Request req{beast_http::verb::post, "/submit", 11};
  req.set(beast_http::field::content_type, "multipart/form-data; boundary=XyZ");
  req.body() = body;
  req.prepare_payload();
  return req;
}

std::string SignedBody(const Stack& s, const std::string& artifact, uint64_t nonce = 1) {
  const std::string payload = R"({"task_id":"t1","miner_id":7,"performance":0.95,"artifact_hash":")" +
                              gate::crypto::Sha256Hex(artifact) +
                              R"(","hyperparameters":{"lr":0.5},"timestamp":)" + std::to_string(kNow) +
                              R"(,"nonce":)" + std::to_string(nonce) + "}";
  const auto signature = gate::util::HexEncode(ed::Sign(s.keys.seed, payload));
  return Part("payload", payload) + Part("signature", signature) + Part("artifact", artifact) + "--XyZ--\r\n";
}

void TestSubmitAcceptThenReplay() {
  Stack      s;
  const auto req = SubmitRequest(SignedBody(s, std::string("weights\0\xff", 9)));

  auto first = s.handler->Handle(req);
  assert(first.result() == beast_http::status::ok);
  assert(first[beast_http::field::content_type] == "application/json");
  assert(first.body() == R"({"status":"accepted","reason":null})");

  auto second = s.handler->Handle(req);
  assert(second.result() == beast_http::status::ok);
  assert(second.body() == R"({"status":"rejected","reason":"replay"})");

  auto tx = s.repo->Begin();
  assert(s.repo->ListLedger(*tx).size() == 1);
}

void TestMissingPartIsRejectionNotError() {
  Stack s;
  auto  res = s.handler->Handle(SubmitRequest(Part("payload", "{}") + Part("artifact", "a") + "--XyZ--\r\n"));
  assert(res.result() == beast_http::status::ok);
  assert(res.body() == R"({"status":"rejected","reason":"missing_fields"})");
}

void TestRejectionReasonIsReported() {
  Stack s;
  auto  body = SignedBody(s, "a");
  // flip the artifact after signing
  body.replace(body.rfind("\r\n\r\na\r\n") + 4, 1, "b");
  auto res = s.handler->Handle(SubmitRequest(body));
  assert(res.result() == beast_http::status::ok);
  assert(res.body() == R"({"status":"rejected","reason":"artifact_hash_mismatch"})");
}

void TestTransportErrors() {
  Stack s;

  Request not_multipart{beast_http::verb::post, "/submit", 11};
  not_multipart.set(beast_http::field::content_type, "application/json");
  not_multipart.body() = "{}";
  not_multipart.prepare_payload();
  assert(s.handler->Handle(not_multipart).result() == beast_http::status::bad_request);

  assert(s.handler->Handle(SubmitRequest("garbage")).result() == beast_http::status::bad_request);

  Request wrong_method{beast_http::verb::get, "/submit", 11};
  assert(s.handler->Handle(wrong_method).result() == beast_http::status::method_not_allowed);

  Request post_task{beast_http::verb::post, "/get_task", 11};
  assert(s.handler->Handle(post_task).result() == beast_http::status::method_not_allowed);

  Request unknown{beast_http::verb::get, "/nope", 11};
  auto    res = s.handler->Handle(unknown);
  assert(res.result() == beast_http::status::not_found);
  assert(res.body().find("\"error\"") != std::string::npos);
}

void TestGetTaskFallsBackToConfiguredTask() {
  Stack   s;
  Request req{beast_http::verb::get, "/get_task?x=1", 11};
  auto    res = s.handler->Handle(req);
  assert(res.result() == beast_http::status::ok);
  assert(res.body() == R"({"task_id":"task-prod-001","performance_threshold":0.5,"validation_data_hash":"00ff"})");
}

void TestGetTaskServesNewestPublishedTask() {
  Stack s;

  gate::v1::TaskInfo a;
  a.set_task_id("a-task");
  a.set_performance_threshold(0.25);
  a.set_validation_data_hash("aa");
  s.admin->AddTask(a);

  gate::v1::TaskInfo b;
  b.set_task_id("b-task");
  b.set_performance_threshold(0.75);
  b.set_validation_data_hash("bb");
  s.admin->AddTask(b);

  auto task = s.service->GetTask();
  assert(task.task_id() == "b-task");
  assert(task.performance_threshold() == 0.75);
  assert(task.validation_data_hash() == "bb");
}

} // namespace

int main() {
  TestSubmitAcceptThenReplay();
  TestMissingPartIsRejectionNotError();
  TestRejectionReasonIsReported();
  TestTransportErrors();
  TestGetTaskFallsBackToConfiguredTask();
  TestGetTaskServesNewestPublishedTask();

  std::cout << "submission_gate_unit_http_handler: pass\n";
  return 0;
}
