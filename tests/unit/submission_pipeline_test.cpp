#include "internal/core/submission_pipeline.hpp"

#include "internal/cache/memory/memory_replay_store.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace ed = gate::crypto::ed25519;

using gate::core::Decision;
using gate::core::RejectReason;
using gate::core::SubmissionEnvelope;

constexpr int64_t kNow     = 1'700'000'000;
constexpr int64_t kMinerId = 7;

class DownStore final : public gate::cache::ReplayStore {
 public:
  bool SetIfAbsent(const std::string&) override {
    throw gate::util::Unavailable("redis down");
  }
  void Expire(const std::string&, std::chrono::seconds) override {
    throw gate::util::Unavailable("redis down");
  }
};

// Forwards everything to a memory repository, but the ledger refuses writes.
class ReadOnlyLedgerRepository final : public gate::db::Repository {
 public:
  explicit ReadOnlyLedgerRepository(std::shared_ptr<gate::db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<gate::db::Transaction> Begin() override {
    return inner_->Begin();
  }
  gate::db::Result UpsertMiner(gate::db::Transaction& tx, const gate::db::model::MinerRecord& r) override {
    return inner_->UpsertMiner(tx, r);
  }
  std::optional<gate::db::model::MinerRecord> GetMiner(gate::db::Transaction& tx, int64_t id) override {
    return inner_->GetMiner(tx, id);
  }
  gate::db::Result InsertLedger(gate::db::Transaction&, const gate::db::model::LedgerRecord&) override {
    return gate::db::Result::Err(gate::db::ErrorCode::IOError, "disk full");
  }
  std::optional<gate::db::model::LedgerRecord> GetLedger(gate::db::Transaction& tx, const std::string& id) override {
    return inner_->GetLedger(tx, id);
  }
  std::vector<gate::db::model::LedgerRecord> ListLedger(gate::db::Transaction& tx) override {
    return inner_->ListLedger(tx);
  }
  gate::db::Result UpsertTask(gate::db::Transaction& tx, const gate::db::model::TaskRecord& r) override {
    return inner_->UpsertTask(tx, r);
  }
  std::optional<gate::db::model::TaskRecord> GetTask(gate::db::Transaction& tx, const std::string& id) override {
    return inner_->GetTask(tx, id);
  }
  std::optional<gate::db::model::TaskRecord> GetCurrentTask(gate::db::Transaction& tx) override {
    return inner_->GetCurrentTask(tx);
  }

 private:
  std::shared_ptr<gate::db::Repository> inner_;
};

// Miner lookups fail, everything else is irrelevant.
class BrokenMinerRepository final : public gate::db::Repository {
 public:
  std::unique_ptr<gate::db::Transaction> Begin() override {
    return memory_.Begin();
  }
  gate::db::Result UpsertMiner(gate::db::Transaction&, const gate::db::model::MinerRecord&) override {
    return gate::db::Result::Err(gate::db::ErrorCode::Unavailable);
  }
  std::optional<gate::db::model::MinerRecord> GetMiner(gate::db::Transaction&, int64_t) override {
    throw gate::util::Unavailable("server closed the connection unexpectedly");
  }
  gate::db::Result InsertLedger(gate::db::Transaction& tx, const gate::db::model::LedgerRecord& r) override {
    return memory_.InsertLedger(tx, r);
  }
  std::optional<gate::db::model::LedgerRecord> GetLedger(gate::db::Transaction& tx, const std::string& id) override {
    return memory_.GetLedger(tx, id);
  }
  std::vector<gate::db::model::LedgerRecord> ListLedger(gate::db::Transaction& tx) override {
    return memory_.ListLedger(tx);
  }
  gate::db::Result UpsertTask(gate::db::Transaction& tx, const gate::db::model::TaskRecord& r) override {
    return memory_.UpsertTask(tx, r);
  }
  std::optional<gate::db::model::TaskRecord> GetTask(gate::db::Transaction& tx, const std::string& id) override {
    return memory_.GetTask(tx, id);
  }
  std::optional<gate::db::model::TaskRecord> GetCurrentTask(gate::db::Transaction& tx) override {
    return memory_.GetCurrentTask(tx);
  }

 private:
  gate::db::memory::MemoryRepository memory_;
};

struct Fixture {
  std::shared_ptr<gate::db::memory::MemoryRepository>     repo  = std::make_shared<gate::db::memory::MemoryRepository>();
  std::shared_ptr<gate::cache::memory::MemoryReplayStore> store = std::make_shared<gate::cache::memory::MemoryReplayStore>();
  ed::KeyPair                                             keys  = ed::GenerateKeyPair();

  Fixture() {
    RegisterMiner(kMinerId, gate::util::HexEncode(keys.public_key));
  }

  void RegisterMiner(int64_t id, const std::string& public_key_hex) {
    auto tx = repo->Begin();
    auto r  = repo->UpsertMiner(*tx, {id, public_key_hex});
    assert(r);
    tx->Commit();
  }

  gate::core::PipelineContext Context(std::shared_ptr<gate::db::Repository> repository = nullptr,
                                      std::shared_ptr<gate::cache::ReplayStore> replay = nullptr) const {
    gate::core::PipelineContext ctx;
    ctx.replay_store = store;
    if (replay) ctx.replay_store = replay;
    ctx.repository = repo;
    if (repository) ctx.repository = repository;
    ctx.max_clock_skew = std::chrono::seconds(60);
    ctx.max_age        = std::chrono::seconds(300);
    ctx.replay_ttl     = std::chrono::seconds(300);
    ctx.now_unix_sec   = [] { return kNow; };
    return ctx;
  }

  size_t LedgerRows() const {
    auto tx = repo->Begin();
    return repo->ListLedger(*tx).size();
  }
};

std::string PayloadJson(int64_t miner_id, const std::string& artifact_hash, int64_t timestamp, uint64_t nonce = 1) {
  return R"({"task_id":"t1","miner_id":)" + std::to_string(miner_id) + R"(,"performance":0.95,"artifact_hash":")" +
         artifact_hash + R"(","hyperparameters":{"lr":0.5},"timestamp":)" + std::to_string(timestamp) +
         R"(,"nonce":)" + std::to_string(nonce) + "}";
}

SubmissionEnvelope Envelope(const std::string& payload, const std::string& seed, const std::string& artifact) {
  SubmissionEnvelope envelope;
  envelope.payload       = payload;
  envelope.signature_hex = gate::util::HexEncode(ed::Sign(seed, payload));
  envelope.artifact      = artifact;
  return envelope;
}

SubmissionEnvelope ValidEnvelope(const Fixture& f, const std::string& artifact = "model-bytes", uint64_t nonce = 1) {
  return Envelope(PayloadJson(kMinerId, gate::crypto::Sha256Hex(artifact), kNow, nonce), f.keys.seed, artifact);
}

void AssertRejected(const Decision& d, RejectReason reason) {
  assert(!d.accepted);
  assert(d.reason == reason);
  assert(d.record_id.empty());
}

void TestAcceptThenReplay() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());

  const auto envelope = ValidEnvelope(f);
  auto       first    = pipeline.Process(envelope);
  assert(first.accepted);
  assert(!first.record_id.empty());
  assert(f.LedgerRows() == 1);

  AssertRejected(pipeline.Process(envelope), RejectReason::kReplay);
  assert(f.LedgerRows() == 1);
}

void TestMissingParts() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());

  auto no_payload = ValidEnvelope(f);
  no_payload.payload.reset();
  AssertRejected(pipeline.Process(no_payload), RejectReason::kMissingFields);

  auto no_signature = ValidEnvelope(f);
  no_signature.signature_hex.reset();
  AssertRejected(pipeline.Process(no_signature), RejectReason::kMissingFields);

  auto no_artifact = ValidEnvelope(f);
  no_artifact.artifact.reset();
  AssertRejected(pipeline.Process(no_artifact), RejectReason::kMissingFields);

  // nothing claimed
  assert(f.store->Size() == 0);
}

void TestInvalidPayloadDoesNotConsumeSignature() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());

  auto envelope = Envelope(R"({"task_id":"t1"})", f.keys.seed, "a");
  AssertRejected(pipeline.Process(envelope), RejectReason::kInvalidPayloadJson);

  envelope = Envelope("{not json", f.keys.seed, "a");
  AssertRejected(pipeline.Process(envelope), RejectReason::kInvalidPayloadJson);

  // well-formed JSON, but a performance no backend can store
  std::string nan_performance = PayloadJson(kMinerId, gate::crypto::Sha256Hex("a"), kNow, 1);
  nan_performance.replace(nan_performance.find("\"performance\":") + 14, 4, "\"NaN\"");
  envelope = Envelope(nan_performance, f.keys.seed, "a");
  AssertRejected(pipeline.Process(envelope), RejectReason::kInvalidPayloadJson);

  assert(f.store->Size() == 0);
  assert(f.LedgerRows() == 0);
}

void TestReplayStoreDown() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context(nullptr, std::make_shared<DownStore>()));
  AssertRejected(pipeline.Process(ValidEnvelope(f)), RejectReason::kRedisError);
  assert(f.LedgerRows() == 0);
}

void TestStaleAndFutureTimestamps() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());
  const auto                     digest = gate::crypto::Sha256Hex("a");

  AssertRejected(pipeline.Process(Envelope(PayloadJson(kMinerId, digest, kNow - 301), f.keys.seed, "a")),
                 RejectReason::kStaleTimestamp);
  AssertRejected(pipeline.Process(Envelope(PayloadJson(kMinerId, digest, kNow + 61), f.keys.seed, "a")),
                 RejectReason::kStaleTimestamp);

  assert(pipeline.Process(Envelope(PayloadJson(kMinerId, digest, kNow - 300), f.keys.seed, "a")).accepted);
  assert(pipeline.Process(Envelope(PayloadJson(kMinerId, digest, kNow + 60), f.keys.seed, "a")).accepted);
  assert(f.LedgerRows() == 2);
}

void TestArtifactMismatch() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());

  auto envelope = ValidEnvelope(f, "model-bytes");
  envelope.artifact = std::string("model-bytez");
  AssertRejected(pipeline.Process(envelope), RejectReason::kArtifactHashMismatch);

  std::string upper = gate::crypto::Sha256Hex("a");
  for (auto& c : upper) {
    if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
  }
  AssertRejected(pipeline.Process(Envelope(PayloadJson(kMinerId, upper, kNow), f.keys.seed, "a")),
                 RejectReason::kArtifactHashMismatch);
}

void TestMinerKeyProblems() {
  Fixture f;
  f.RegisterMiner(8, "zz-not-hex");
  f.RegisterMiner(9, "00ff");
  gate::core::SubmissionPipeline pipeline(f.Context());
  const auto                     digest = gate::crypto::Sha256Hex("a");

  AssertRejected(pipeline.Process(Envelope(PayloadJson(404, digest, kNow), f.keys.seed, "a")),
                 RejectReason::kUnknownMiner);
  AssertRejected(pipeline.Process(Envelope(PayloadJson(8, digest, kNow), f.keys.seed, "a")),
                 RejectReason::kInvalidPubkey);
  AssertRejected(pipeline.Process(Envelope(PayloadJson(9, digest, kNow), f.keys.seed, "a")), RejectReason::kBadPubkey);
}

void TestKeyLookupFailure() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context(std::make_shared<BrokenMinerRepository>()));
  AssertRejected(pipeline.Process(ValidEnvelope(f)), RejectReason::kDbError);
}

void TestSignatureProblems() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());

  auto malformed          = ValidEnvelope(f, "a", 1);
  malformed.signature_hex = std::string("xyz");
  AssertRejected(pipeline.Process(malformed), RejectReason::kSignatureParseError);

  auto short_sig          = ValidEnvelope(f, "a", 2);
  short_sig.signature_hex = short_sig.signature_hex->substr(0, 64);
  AssertRejected(pipeline.Process(short_sig), RejectReason::kSignatureParseError);

  // signed by someone else
  const auto other  = ed::GenerateKeyPair();
  const auto forged = Envelope(PayloadJson(kMinerId, gate::crypto::Sha256Hex("a"), kNow, 3), other.seed, "a");
  AssertRejected(pipeline.Process(forged), RejectReason::kBadSignature);

  // signature over a re-serialized form of the same payload
  auto reformatted    = ValidEnvelope(f, "a", 4);
  reformatted.payload = " " + *reformatted.payload;
  AssertRejected(pipeline.Process(reformatted), RejectReason::kBadSignature);

  assert(f.LedgerRows() == 0);
}

void TestLedgerFailure() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context(std::make_shared<ReadOnlyLedgerRepository>(f.repo)));
  AssertRejected(pipeline.Process(ValidEnvelope(f)), RejectReason::kDbError);
  assert(f.LedgerRows() == 0);
}

void TestStageOrder() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());
  const auto                     digest = gate::crypto::Sha256Hex("a");

  // replay beats everything after it
  auto first = Envelope(PayloadJson(kMinerId, digest, kNow - 1000), f.keys.seed, "a");
  AssertRejected(pipeline.Process(first), RejectReason::kStaleTimestamp);
  AssertRejected(pipeline.Process(first), RejectReason::kReplay);

  // freshness before integrity
  auto stale_and_wrong = Envelope(PayloadJson(kMinerId, digest, kNow - 1000, 2), f.keys.seed, "b");
  AssertRejected(pipeline.Process(stale_and_wrong), RejectReason::kStaleTimestamp);

  // integrity before key lookup
  auto wrong_and_unknown = Envelope(PayloadJson(404, digest, kNow), f.keys.seed, "b");
  AssertRejected(pipeline.Process(wrong_and_unknown), RejectReason::kArtifactHashMismatch);

  // key lookup before signature
  auto unknown_and_unsigned          = Envelope(PayloadJson(404, digest, kNow, 3), f.keys.seed, "a");
  unknown_and_unsigned.signature_hex = std::string(128, '0');
  AssertRejected(pipeline.Process(unknown_and_unsigned), RejectReason::kUnknownMiner);

  assert(f.LedgerRows() == 0);
}

void TestConcurrentDuplicatesAcceptOnce() {
  Fixture                        f;
  gate::core::SubmissionPipeline pipeline(f.Context());
  const auto                     envelope = ValidEnvelope(f);

  constexpr int            kThreads = 12;
  std::atomic<int>         accepted{0};
  std::atomic<int>         replays{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto d = pipeline.Process(envelope);
      if (d.accepted) {
        accepted.fetch_add(1);
      } else if (d.reason == RejectReason::kReplay) {
        replays.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(accepted.load() == 1);
  assert(replays.load() == kThreads - 1);
  assert(f.LedgerRows() == 1);
}

void TestReasonCodes() {
  assert(std::string(gate::core::ReasonCode(RejectReason::kMissingFields)) == "missing_fields");
  assert(std::string(gate::core::ReasonCode(RejectReason::kRedisError)) == "redis_error");
  assert(std::string(gate::core::ReasonCode(RejectReason::kSignatureParseError)) == "signature_parse_error");
  assert(std::string(gate::core::ReasonCode(RejectReason::kBadSignature)) == "bad_signature");
}

} // namespace

int main() {
  TestAcceptThenReplay();
  TestMissingParts();
  TestInvalidPayloadDoesNotConsumeSignature();
  TestReplayStoreDown();
  TestStaleAndFutureTimestamps();
  TestArtifactMismatch();
  TestMinerKeyProblems();
  TestKeyLookupFailure();
  TestSignatureProblems();
  TestLedgerFailure();
  TestStageOrder();
  TestConcurrentDuplicatesAcceptOnce();
  TestReasonCodes();

  std::cout << "submission_gate_unit_submission_pipeline: pass\n";
  return 0;
}
