#pragma once

#include <string>
#include <string_view>

#include "internal/ingest/ingestion_client.hpp"

namespace kbsync::ingest {

// HTTP status -> outcome class (2xx ok, 404, 408/429/5xx transient, rest rejected).
ApiStatus ClassifyHttpStatus(long http_status);

/*
  Builds the result of a Submit/GetKnowledge call from a received
  response.

  2xx bodies must be a {"success", "message", "data"} envelope; a body
  that is not, or that says success=false, is kTransient. Error bodies
  contribute their "message" (or "detail") to the error text when
  present.
*/
KnowledgeResult ParseKnowledgeResponse(long http_status, std::string_view body);

// Same classification for DELETE, where the body is optional.
ApiResult ParseDeleteResponse(long http_status, std::string_view body);

} // namespace kbsync::ingest
