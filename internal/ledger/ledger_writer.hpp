#pragma once

#include <memory>
#include <string>

#include "gate/v1/submission.pb.h"
#include "internal/db/api/repository.hpp"

namespace gate::ledger {

struct CommitResult {
  bool        committed = false;
  std::string record_id; // set when committed
  std::string error;     // set otherwise
};

/*
  Appends one accepted submission to the ledger.

  Each call generates a fresh v4 id and runs in its own transaction.
  Failures are reported, never retried here.
*/
class LedgerWriter {
 public:
  explicit LedgerWriter(std::shared_ptr<db::Repository> repository);

  CommitResult Commit(const gate::v1::SubmissionPayload& payload, const std::string& artifact_digest) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace gate::ledger
