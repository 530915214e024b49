#include "internal/verify/key_directory.hpp"

#include "internal/crypto/ed25519.hpp"
#include "internal/util/hex.hpp"

namespace gate::verify {

KeyDirectory::KeyDirectory(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

KeyLookup KeyDirectory::Lookup(int64_t miner_id) const {
  KeyLookup out;

  std::optional<db::model::MinerRecord> miner;
  try {
    auto tx = repository_->Begin();
    miner   = repository_->GetMiner(*tx, miner_id);
    tx->Commit();
  } catch (const std::exception& e) {
    out.status = KeyLookupStatus::kStoreError;
    out.error  = e.what();
    return out;
  }

  if (!miner) {
    out.status = KeyLookupStatus::kNotFound;
    return out;
  }

  auto bytes = util::HexDecode(miner->public_key_hex);
  if (!bytes) {
    out.status = KeyLookupStatus::kInvalidEncoding;
    return out;
  }

  if (!crypto::ed25519::IsValidPublicKey(*bytes)) {
    out.status = KeyLookupStatus::kInvalidKey;
    return out;
  }

  out.status     = KeyLookupStatus::kFound;
  out.public_key = std::move(*bytes);
  return out;
}

} // namespace gate::verify
