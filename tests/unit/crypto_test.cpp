#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/util/hex.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

namespace ed = gate::crypto::ed25519;

// RFC 8032, section 7.1, TEST 1
constexpr const char* kRfcSeed = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr const char* kRfcPublic = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr const char* kRfcSignature =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

std::string Bytes(const char* hex) {
  auto out = gate::util::HexDecode(hex);
  assert(out);
  return *out;
}

void TestSha256KnownVectors() {
  assert(gate::crypto::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(gate::crypto::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(gate::crypto::Sha256("abc").size() == gate::crypto::kSha256Size);
}

void TestRfc8032Vector() {
  const auto seed = Bytes(kRfcSeed);
  const auto pk   = Bytes(kRfcPublic);

  assert(ed::PublicKeyFromSeed(seed) == pk);
  assert(gate::util::HexEncode(ed::Sign(seed, "")) == kRfcSignature);
  assert(ed::Verify(pk, "", Bytes(kRfcSignature)));
  assert(!ed::Verify(pk, "x", Bytes(kRfcSignature)));
}

void TestGeneratedKeysSignAndVerify() {
  const auto pair = ed::GenerateKeyPair();
  assert(pair.seed.size() == ed::kSeedSize);
  assert(pair.public_key.size() == ed::kPublicKeySize);
  assert(ed::PublicKeyFromSeed(pair.seed) == pair.public_key);

  const std::string message = R"({"task_id":"t","nonce":1})";
  auto              sig     = ed::Sign(pair.seed, message);
  assert(sig.size() == ed::kSignatureSize);
  assert(ed::Verify(pair.public_key, message, sig));

  sig[0] = static_cast<char>(sig[0] ^ 0x01);
  assert(!ed::Verify(pair.public_key, message, sig));
}

void TestWrongSizesAreRejected() {
  const auto pair = ed::GenerateKeyPair();
  assert(!ed::IsValidPublicKey(pair.public_key.substr(0, 31)));
  assert(!ed::IsValidPublicKey(pair.public_key + "x"));
  assert(ed::IsValidPublicKey(pair.public_key));

  const auto sig = ed::Sign(pair.seed, "m");
  assert(!ed::Verify(pair.public_key, "m", sig.substr(0, 63)));
  assert(!ed::Verify(pair.public_key.substr(0, 16), "m", sig));
}

} // namespace

int main() {
  TestSha256KnownVectors();
  TestRfc8032Vector();
  TestGeneratedKeysSignAndVerify();
  TestWrongSizesAreRejected();

  std::cout << "submission_gate_unit_crypto: pass\n";
  return 0;
}
