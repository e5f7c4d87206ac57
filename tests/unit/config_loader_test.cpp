#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using market::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "market_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigLoadsFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:50061"
database:
  sqlite:
    path: "/tmp/market.db"
    wal_mode: true
logging:
  level: debug
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 5000
chain:
  clock: CLOCK_MODE_WALL
  genesis_height: 1000
  block_interval_ms: 600000
  contract_principal: "SP000.compute-market"
token:
  genesis_balances:
    alice: 1000
    bob: 18446744073709551615
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50061");
  assert(config.database().sqlite().path() == "/tmp/market.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == market::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 5000);
  assert(config.chain().clock() == market::runtime::config::CLOCK_MODE_WALL);
  assert(config.chain().genesis_height() == 1000);
  assert(config.chain().block_interval_ms() == 600000);
  assert(config.chain().contract_principal() == "SP000.compute-market");
  assert(config.token().genesis_balances().at("alice") == 1000);
  // 64-bit amounts survive the YAML -> JSON hop exactly.
  assert(config.token().genesis_balances().at("bob") == 18446744073709551615ULL);
}

void TestDefaultsApplyToEmptyDocument() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == market::config::kDefaultBindAddress);
  assert(config.chain().clock() == market::runtime::config::CLOCK_MODE_MANUAL);
  assert(config.chain().contract_principal() == "market.escrow");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(chain:
  contract_principal: "12345"
)");
  assert(config.chain().contract_principal() == "12345");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\market\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\market\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestWallClockNeedsBlockInterval() {
  assert(Rejects(R"(chain:
  clock: CLOCK_MODE_WALL
)"));
  assert(!Rejects(R"(chain:
  clock: CLOCK_MODE_MANUAL
)"));
}

void TestEmptyBackendSettingsAreRejected() {
  assert(Rejects(R"(database:
  sqlite:
    wal_mode: true
)"));
  assert(Rejects(R"(database:
  postgres:
    max_connections: 4
)"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/market-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoadsFromFile();
  TestDefaultsApplyToEmptyDocument();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestWallClockNeedsBlockInterval();
  TestEmptyBackendSettingsAreRejected();
  TestMissingFileIsReported();

  std::cout << "market_unit_config_loader: pass\n";
  return 0;
}
