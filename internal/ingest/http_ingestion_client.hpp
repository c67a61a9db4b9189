#pragma once

#include <cstdint>
#include <string>

#include "internal/ingest/ingestion_client.hpp"

namespace kbsync::runtime::config {
class IngestionConfig;
}

namespace kbsync::ingest {

struct HttpClientOptions {
  std::string base_url;
  std::string api_prefix;
  std::string api_key;
  std::string knowledge_base_id;
  uint32_t    connect_timeout_ms = 10000;
  uint32_t    request_timeout_ms = 60000;
  bool        enable_multimodel  = false;

  static HttpClientOptions FromConfig(const kbsync::runtime::config::IngestionConfig& config);
};

/*
  libcurl implementation of IngestionClient.

  One easy handle per request, so an instance may be shared by the
  threads of a single stage. Every request carries both the connect and
  the total timeout.
*/
class HttpIngestionClient final : public IngestionClient {
 public:
  explicit HttpIngestionClient(HttpClientOptions options);

  KnowledgeResult Submit(const UploadRequest& request) override;
  KnowledgeResult GetKnowledge(const std::string& knowledge_id) override;
  ApiResult       DeleteKnowledge(const std::string& knowledge_id) override;

  const HttpClientOptions& Options() const {
    return options_;
  }

 private:
  std::string Url(const std::string& path) const;
  std::string KnowledgeUrl(const std::string& knowledge_id) const;

  HttpClientOptions options_;
};

} // namespace kbsync::ingest
