#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace gate::verify {

enum class KeyLookupStatus {
  kFound,
  kNotFound,
  kInvalidEncoding, // stored text is not hex
  kInvalidKey,      // decoded bytes are not a usable Ed25519 key
  kStoreError,
};

struct KeyLookup {
  KeyLookupStatus status = KeyLookupStatus::kNotFound;
  std::string     public_key; // raw 32 bytes when kFound
  std::string     error;      // store message when kStoreError
};

// Read-only view of the miners table.
class KeyDirectory {
 public:
  explicit KeyDirectory(std::shared_ptr<db::Repository> repository);

  KeyLookup Lookup(int64_t miner_id) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace gate::verify
