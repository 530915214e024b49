#include "admin_service.hpp"

#include <stdexcept>

#include "internal/crypto/ed25519.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "observe.hpp"

namespace gate::service {

namespace {

void ThrowIfDbError(const gate::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  throw std::runtime_error(prefix + ": " + result.message);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AdminService::RegisterMiner(int64_t miner_id, const std::string& public_key_hex) {
  ObserveRpc("AdminService.RegisterMiner", [&] {
    auto key = gate::util::HexDecode(public_key_hex);
    if (!key || !gate::crypto::ed25519::IsValidPublicKey(*key)) {
      throw gate::util::InvalidArgument("public key must be 64 hex characters of a valid Ed25519 key");
    }

    gate::db::model::MinerRecord record;
    record.miner_id       = miner_id;
    record.public_key_hex = gate::util::ToLowerAscii(public_key_hex);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpsertMiner(*tx, record), "register miner");
    tx->Commit();

    GATE_LOG_INFO("miner registered", {gate::observability::IntField("miner_id", miner_id)});
  });
}

void AdminService::AddTask(const gate::v1::TaskInfo& task) {
  ObserveRpc("AdminService.AddTask", [&] {
    if (task.task_id().empty()) {
      throw gate::util::InvalidArgument("task_id is required");
    }

    gate::db::model::TaskRecord record;
    record.task_id               = task.task_id();
    record.performance_threshold = task.performance_threshold();
    record.validation_data_hash  = task.validation_data_hash();
    record.created_at_ms         = gate::util::ToUnixMillis(gate::util::Now());

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpsertTask(*tx, record), "add task");
    tx->Commit();

    GATE_LOG_INFO("task published", {gate::observability::StringField("task_id", task.task_id())});
  });
}

}
