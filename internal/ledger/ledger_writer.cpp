#include "internal/ledger/ledger_writer.hpp"

#include <exception>
#include <utility>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace gate::ledger {

LedgerWriter::LedgerWriter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

CommitResult LedgerWriter::Commit(const gate::v1::SubmissionPayload& payload, const std::string& artifact_digest) const {
  CommitResult out;

  try {
    db::model::LedgerRecord record;
    record.id                   = util::ToString(util::GenerateUUID());
    record.task_id              = payload.task_id();
    record.miner_id             = payload.miner_id();
    record.performance          = payload.performance();
    record.hyperparameters_json = payload.has_hyperparameters_json() ? payload.hyperparameters_json() : "null";
    record.artifact_hash        = artifact_digest;
    record.submitted_at         = util::FromUnixSeconds(static_cast<int64_t>(payload.timestamp()));

    auto tx     = repository_->Begin();
    auto result = repository_->InsertLedger(*tx, record);
    if (!result) {
      out.error = result.message.empty() ? "ledger insert failed" : result.message;
      return out;
    }
    tx->Commit();

    out.committed = true;
    out.record_id = std::move(record.id);
  } catch (const std::exception& e) {
    out.error = e.what();
  }

  return out;
}

} // namespace gate::ledger
