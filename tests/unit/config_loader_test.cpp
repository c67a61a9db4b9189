#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using kbsync::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "kbsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnvironment() {
  ::unsetenv("KBSYNC_API_URL");
  ::unsetenv("KBSYNC_API_KEY");
  ::unsetenv("KBSYNC_KNOWLEDGE_BASE_ID");
  ::unsetenv("KBSYNC_DB_PATH");
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsFillEmptyDocument() {
  auto config = ConfigLoader::LoadFromString("discovery:\n  roots: [\"/srv/erp\"]\n");

  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "kbsync.db");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.discovery().min_file_size_bytes() == 1024);
  assert(config.discovery().purge_remote_on_change());
  assert(config.ingestion().base_url() == "http://localhost:8000");
  assert(config.ingestion().api_prefix() == "/api/v1");
  assert(config.ingestion().connect_timeout_ms() == 10000);
  assert(config.ingestion().request_timeout_ms() == 60000);
  assert(config.submission().batch_size() == 50);
  assert(config.submission().hash_algorithm() == "sha256");
  assert(config.poller().batch_size() == 0);
  assert(config.poller().request_delay_ms() == 200);
  assert(config.schedule().discover_interval_s() == 600);
  assert(config.schedule().submit_interval_s() == 120);
  assert(config.schedule().poll_interval_s() == 120);
}

void TestFullDocumentFromFile() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/kbsync/ledger.db"
    busy_timeout_ms: 2500
discovery:
  roots: ["/srv/erp/upimages"]
  extensions: [pdf, docx]
  min_file_size_bytes: 0
  follow_symlinks: true
  purge_remote_on_change: false
ingestion:
  base_url: "https://kb.example.com"
  knowledge_base_id: "kb-42"
  enable_multimodel: true
submission:
  batch_size: 10
  hash_algorithm: md5
poller:
  batch_size: 100
  request_delay_ms: 0
schedule:
  poll_interval_s: 30
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "/var/lib/kbsync/ledger.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.discovery().extensions_size() == 2);
  assert(config.discovery().has_min_file_size_bytes() && config.discovery().min_file_size_bytes() == 0);
  assert(config.discovery().follow_symlinks());
  assert(!config.discovery().purge_remote_on_change());
  assert(config.ingestion().knowledge_base_id() == "kb-42");
  assert(config.ingestion().enable_multimodel());
  assert(config.submission().batch_size() == 10);
  assert(config.submission().hash_algorithm() == "md5");
  assert(config.poller().batch_size() == 100);
  assert(config.poller().request_delay_ms() == 0);
  assert(config.schedule().poll_interval_s() == 30);
  assert(config.schedule().discover_interval_s() == 600);
}

void TestMemoryBackendIsKept() {
  auto config = ConfigLoader::LoadFromString("database:\n  memory: {}\n");
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestEnvironmentOverrides() {
  ::setenv("KBSYNC_API_URL", "http://ingest:9000", 1);
  ::setenv("KBSYNC_API_KEY", "secret", 1);
  ::setenv("KBSYNC_KNOWLEDGE_BASE_ID", "kb-env", 1);
  ::setenv("KBSYNC_DB_PATH", "/tmp/env.db", 1);

  auto config = ConfigLoader::LoadFromString(R"(database:
  memory: {}
ingestion:
  base_url: "http://configured:8000"
  knowledge_base_id: "kb-file"
)");
  ClearEnvironment();

  assert(config.ingestion().base_url() == "http://ingest:9000");
  assert(config.ingestion().api_key() == "secret");
  assert(config.ingestion().knowledge_base_id() == "kb-env");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/env.db");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(ingestion:
  knowledge_base_id: "2024"
)");
  assert(config.ingestion().knowledge_base_id() == "2024");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(discovery:
  roots: ["/srv/erp"]
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestValidation() {
  assert(Rejects("submission:\n  hash_algorithm: crc32\n"));
  assert(Rejects("ingestion:\n  base_url: \"ftp://host\"\n"));
  assert(Rejects("ingestion:\n  api_prefix: \"api/v1\"\n"));
  assert(Rejects("discovery:\n  roots: [\"relative/dir\"]\n"));
  assert(Rejects("discovery:\n  root_groups: [{prefix: \"/srv\", suffix: \"x\"}]\n"));
  assert(Rejects("- not\n- a\n- mapping\n"));
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/kbsync.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRootGroupExpansion() {
  auto config = ConfigLoader::LoadFromString(R"(discovery:
  roots: ["/srv/erp/upimages/", "/srv/zbintel/a/SYSA/Edit/upimages"]
  root_groups:
    - prefix: "/srv/zbintel"
      suffix: "SYSA/Edit/upimages"
      midfixes: [a, b, "2024"]
)");

  auto roots = ConfigLoader::ExpandRoots(config.discovery());
  assert(roots.size() == 4);
  assert(roots[0] == "/srv/erp/upimages");
  assert(roots[1] == "/srv/zbintel/a/SYSA/Edit/upimages");
  assert(roots[2] == "/srv/zbintel/b/SYSA/Edit/upimages");
  assert(roots[3] == "/srv/zbintel/2024/SYSA/Edit/upimages");
}

void TestDiscoveryNeedsRoots() {
  auto no_roots = ConfigLoader::LoadFromString("database:\n  memory: {}\n");
  bool rejected = false;
  try {
    ConfigLoader::RequireDiscoveryRoots(no_roots);
  } catch (const std::runtime_error& e) {
    rejected = std::string(e.what()).find("discovery.roots") != std::string::npos;
  }
  assert(rejected);

  // a root group alone is enough
  auto grouped = ConfigLoader::LoadFromString(R"(discovery:
  root_groups:
    - prefix: /srv/erp
      midfixes: [a]
)");
  ConfigLoader::RequireDiscoveryRoots(grouped);

  auto rooted = ConfigLoader::LoadFromString("discovery:\n  roots: [\"/srv/erp\"]\n");
  ConfigLoader::RequireDiscoveryRoots(rooted);
}

} // namespace

int main() {
  ClearEnvironment();

  TestDefaultsFillEmptyDocument();
  TestFullDocumentFromFile();
  TestMemoryBackendIsKept();
  TestEnvironmentOverrides();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestValidation();
  TestMissingFileIsAnError();
  TestRootGroupExpansion();
  TestDiscoveryNeedsRoots();

  std::cout << "kbsync_unit_config_loader: pass\n";
  return 0;
}
