#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/ingest/http_ingestion_client.hpp"

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: knowledge_status_example <config.yaml> <knowledge-id>\n";
    return 1;
  }

  kbsync::runtime::config::RuntimeConfig config;
  try {
    config = kbsync::config::ConfigLoader::LoadFromYaml(argv[1]);
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  kbsync::ingest::HttpIngestionClient client(kbsync::ingest::HttpClientOptions::FromConfig(config.ingestion()));

  // GetKnowledge never throws; the outcome class tells what happened.
  auto result = client.GetKnowledge(argv[2]);
  if (!result.ok()) {
    std::cerr << "lookup failed (" << kbsync::ingest::ToString(result.status) << ", http " << result.http_status << "): " << result.message << '\n';
    return 1;
  }

  const auto& knowledge = result.knowledge;
  std::cout << "knowledge " << knowledge.id() << " in " << knowledge.knowledge_base_id() << '\n';
  std::cout << "file: " << knowledge.file_name() << " parse_status: " << knowledge.parse_status() << '\n';
  if (!knowledge.error_message().empty()) {
    std::cout << "error: " << knowledge.error_message() << '\n';
  }

  return 0;
}
