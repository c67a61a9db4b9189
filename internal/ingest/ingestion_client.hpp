#pragma once

#include <string>

#include "kbsync/ingest/v1/knowledge.pb.h"

namespace kbsync::ingest {

/*
  Outcome class of one remote call.

  kTransient: timeout, connection error, 408/429/5xx, success=false or an
              unreadable body. Nothing is changed; retried next cycle.
  kRejected:  any other 4xx. Definitive.
  kNotFound:  404.
*/
enum class ApiStatus {
  kOk,
  kNotFound,
  kTransient,
  kRejected,
};

const char* ToString(ApiStatus status);

struct ApiResult {
  ApiStatus   status      = ApiStatus::kOk;
  long        http_status = 0; // 0 when no response was received
  std::string message;         // error detail when status != kOk

  bool ok() const {
    return status == ApiStatus::kOk;
  }
};

struct KnowledgeResult : ApiResult {
  kbsync::ingest::v1::Knowledge knowledge; // set when ok()
};

struct UploadRequest {
  std::string file_name;
  std::string content;
};

/*
  Seam to the external ingestion service.

  Implementations never throw for remote failures; everything is reported
  through the returned status so a stage can keep going with the next
  record.
*/
class IngestionClient {
 public:
  virtual ~IngestionClient() = default;

  // POST {prefix}/knowledge-bases/{kb}/knowledge/file
  virtual KnowledgeResult Submit(const UploadRequest& request) = 0;

  // GET {prefix}/knowledge/{id}
  virtual KnowledgeResult GetKnowledge(const std::string& knowledge_id) = 0;

  // DELETE {prefix}/knowledge/{id}
  virtual ApiResult DeleteKnowledge(const std::string& knowledge_id) = 0;
};

} // namespace kbsync::ingest
