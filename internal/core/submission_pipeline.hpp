#pragma once

#include "internal/core/decision.hpp"
#include "internal/core/pipeline_context.hpp"
#include "internal/core/submission.hpp"
#include "internal/ledger/ledger_writer.hpp"
#include "internal/verify/freshness_checker.hpp"
#include "internal/verify/integrity_checker.hpp"
#include "internal/verify/key_directory.hpp"
#include "internal/verify/replay_guard.hpp"
#include "internal/verify/signature_verifier.hpp"

namespace gate::core {

/*
  Admission pipeline for one submission.

  Stage order is fixed:

    fields -> payload json -> replay claim -> freshness -> artifact digest
      -> miner key -> signature -> ledger commit

  The first failing stage decides; nothing after it runs. A signature is
  consumed by the replay claim even when a later stage rejects.

  Process() never throws for client or backend failures, and logs exactly
  one decision line per call. Safe to call from many threads at once.
*/
class SubmissionPipeline {
 public:
  explicit SubmissionPipeline(PipelineContext context);

  Decision Process(const SubmissionEnvelope& envelope) const;

 private:
  Decision Run(const SubmissionEnvelope& envelope, int64_t& miner_id, std::string& task_id) const;

  PipelineContext          context_;
  verify::ReplayGuard      replay_guard_;
  verify::FreshnessChecker freshness_;
  verify::IntegrityChecker integrity_;
  verify::KeyDirectory     keys_;
  verify::SignatureVerifier signatures_;
  ledger::LedgerWriter     ledger_;
};

} // namespace gate::core
