#include "internal/core/submission_pipeline.hpp"

#include <chrono>

#include "internal/core/payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace gate::core {

namespace {

// span + latency histogram for one stage
class StageScope {
 public:
  explicit StageScope(const char* stage)
      : stage_(stage), span_(std::string("gate.stage.") + stage), start_(std::chrono::steady_clock::now()) {
  }

  ~StageScope() {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    observability::Metrics::Instance().ObserveStageLatencyMs(stage_, elapsed);
  }

  void Fail(const char* outcome) {
    span_.SetAttribute("outcome", std::string_view(outcome));
  }

 private:
  const char*              stage_;
  observability::SpanScope span_;
  std::chrono::steady_clock::time_point start_;
};

std::function<int64_t()> SystemClock() {
  return [] { return util::ToUnixSeconds(util::Now()); };
}

} // namespace

SubmissionPipeline::SubmissionPipeline(PipelineContext context)
    : context_(std::move(context)),
      replay_guard_(context_.replay_store, context_.replay_ttl),
      freshness_(context_.max_clock_skew, context_.max_age),
      keys_(context_.repository),
      ledger_(context_.repository) {
  if (!context_.now_unix_sec) context_.now_unix_sec = SystemClock();
}

Decision SubmissionPipeline::Process(const SubmissionEnvelope& envelope) const {
  observability::SpanScope span("gate.submission.process");

  int64_t     miner_id = 0;
  std::string task_id;
  auto        decision = Run(envelope, miner_id, task_id);

  span.SetAttribute("miner_id", miner_id);
  span.SetAttribute("task_id", std::string_view(task_id));

  if (decision.accepted) {
    observability::Metrics::Instance().RecordDecision("accepted");
    GATE_LOG_INFO("submission accepted", {observability::IntField("miner_id", miner_id),
                  observability::StringField("task_id", task_id), observability::StringField("record_id", decision.record_id)});
  } else {
    const char* code = ReasonCode(decision.reason);
    observability::Metrics::Instance().RecordDecision(code);
    span.SetAttribute("reason", std::string_view(code));
    GATE_LOG_INFO("submission rejected", {observability::IntField("miner_id", miner_id),
                  observability::StringField("task_id", task_id), observability::StringField("reason", code)});
  }

  return decision;
}

Decision SubmissionPipeline::Run(const SubmissionEnvelope& envelope, int64_t& miner_id, std::string& task_id) const {
  if (!envelope.payload || !envelope.signature_hex || !envelope.artifact) {
    return Decision::Reject(RejectReason::kMissingFields);
  }

  std::optional<gate::v1::SubmissionPayload> payload;
  {
    StageScope stage("parse");
    payload = ParsePayload(*envelope.payload);
    if (!payload) {
      stage.Fail("invalid");
      return Decision::Reject(RejectReason::kInvalidPayloadJson);
    }
  }
  miner_id = payload->miner_id();
  task_id  = payload->task_id();

  {
    StageScope stage("replay");
    switch (replay_guard_.Claim(*envelope.signature_hex)) {
      case verify::ClaimResult::kClaimed:
        break;
      case verify::ClaimResult::kAlreadyClaimed:
        stage.Fail("replay");
        return Decision::Reject(RejectReason::kReplay);
      case verify::ClaimResult::kStoreUnavailable:
        stage.Fail("store_unavailable");
        return Decision::Reject(RejectReason::kRedisError);
    }
  }

  {
    StageScope stage("freshness");
    const auto now    = context_.now_unix_sec();
    const auto result = freshness_.Check(payload->timestamp(), now);
    if (result != verify::Freshness::kFresh) {
      stage.Fail(verify::ToString(result));
      GATE_LOG_DEBUG("timestamp outside window", {observability::StringField("kind", verify::ToString(result)),
                     observability::IntField("claimed", static_cast<int64_t>(payload->timestamp())),
                     observability::IntField("now", now)});
      return Decision::Reject(RejectReason::kStaleTimestamp);
    }
  }

  {
    StageScope stage("integrity");
    if (integrity_.Verify(*envelope.artifact, payload->artifact_hash()) != verify::Integrity::kMatch) {
      stage.Fail("mismatch");
      return Decision::Reject(RejectReason::kArtifactHashMismatch);
    }
  }

  verify::KeyLookup key;
  {
    StageScope stage("key_lookup");
    key = keys_.Lookup(payload->miner_id());
    switch (key.status) {
      case verify::KeyLookupStatus::kFound:
        break;
      case verify::KeyLookupStatus::kNotFound:
        stage.Fail("not_found");
        return Decision::Reject(RejectReason::kUnknownMiner);
      case verify::KeyLookupStatus::kInvalidEncoding:
        stage.Fail("invalid_encoding");
        return Decision::Reject(RejectReason::kInvalidPubkey);
      case verify::KeyLookupStatus::kInvalidKey:
        stage.Fail("invalid_key");
        return Decision::Reject(RejectReason::kBadPubkey);
      case verify::KeyLookupStatus::kStoreError:
        stage.Fail("store_error");
        GATE_LOG_ERROR("miner key lookup failed", {observability::IntField("miner_id", payload->miner_id()),
                       observability::StringField("error", key.error)});
        return Decision::Reject(RejectReason::kDbError);
    }
  }

  {
    StageScope stage("signature");
    switch (signatures_.Verify(*envelope.payload, *envelope.signature_hex, key.public_key)) {
      case verify::SignatureCheck::kValid:
        break;
      case verify::SignatureCheck::kMalformed:
        stage.Fail("malformed");
        return Decision::Reject(RejectReason::kSignatureParseError);
      case verify::SignatureCheck::kInvalid:
        stage.Fail("invalid");
        return Decision::Reject(RejectReason::kBadSignature);
    }
  }

  StageScope stage("ledger");
  auto       commit = ledger_.Commit(*payload, payload->artifact_hash());
  if (!commit.committed) {
    stage.Fail("store_error");
    GATE_LOG_ERROR("ledger commit failed", {observability::IntField("miner_id", payload->miner_id()),
                   observability::StringField("error", commit.error)});
    return Decision::Reject(RejectReason::kDbError);
  }
  return Decision::Accept(std::move(commit.record_id));
}

} // namespace gate::core
