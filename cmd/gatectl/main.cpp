#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/hex.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  gatectl keygen\n"
            << "  gatectl sign <seed_hex> <payload_file>\n"
            << "  gatectl digest <artifact_file>\n"
            << "  gatectl [--config <config.yaml>] register-miner <miner_id> <public_key_hex>\n"
            << "  gatectl [--config <config.yaml>] add-task <task_id> <performance_threshold> <validation_data_hash>\n"
            << "\n"
            << "Store commands use DATABASE_URL when no config file is given.\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::string DecodeHexArg(const std::string& hex, const char* what) {
  auto bytes = gate::util::HexDecode(hex);
  if (!bytes) {
    throw std::runtime_error(std::string(what) + " is not valid hex");
  }
  return *bytes;
}

static gate::service::AdminService OpenAdmin(const std::optional<std::string>& config_path) {
  auto config = config_path ? gate::config::ConfigLoader::LoadFromYaml(*config_path) : gate::config::ConfigLoader::FromEnvironment();
  if (config.database().has_memory()) {
    throw std::runtime_error("no durable store configured: pass --config or set DATABASE_URL");
  }

  gate::service::ServiceContext ctx;
  ctx.repository = gate::factory::BuildRepository(config);
  return gate::service::AdminService(ctx);
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    if (cmd == "keygen" && args.size() == 1) {
      auto pair = gate::crypto::ed25519::GenerateKeyPair();
      std::cout << "seed=" << gate::util::HexEncode(pair.seed) << "\n"
                << "public_key=" << gate::util::HexEncode(pair.public_key) << "\n";
      return 0;
    }

    if (cmd == "sign" && args.size() == 3) {
      const auto seed = DecodeHexArg(args[1], "seed");
      if (seed.size() != gate::crypto::ed25519::kSeedSize) {
        throw std::runtime_error("seed must be 32 bytes");
      }
      std::cout << gate::util::HexEncode(gate::crypto::ed25519::Sign(seed, ReadFile(args[2]))) << "\n";
      return 0;
    }

    if (cmd == "digest" && args.size() == 2) {
      std::cout << gate::crypto::Sha256Hex(ReadFile(args[1])) << "\n";
      return 0;
    }

    if (cmd == "register-miner" && args.size() == 3) {
      gate::observability::InitializeLogging();
      auto admin = OpenAdmin(config_path);
      admin.RegisterMiner(std::stoll(args[1]), args[2]);
      std::cout << "registered miner " << args[1] << "\n";
      return 0;
    }

    if (cmd == "add-task" && args.size() == 4) {
      gate::observability::InitializeLogging();
      auto admin = OpenAdmin(config_path);

      gate::v1::TaskInfo task;
      task.set_task_id(args[1]);
      task.set_performance_threshold(std::stod(args[2]));
      task.set_validation_data_hash(args[3]);
      admin.AddTask(task);
      std::cout << "published task " << args[1] << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "gatectl: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
