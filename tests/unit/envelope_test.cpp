#include "internal/ingest/envelope.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using kbsync::ingest::ApiStatus;
using kbsync::ingest::ClassifyHttpStatus;
using kbsync::ingest::ParseDeleteResponse;
using kbsync::ingest::ParseKnowledgeResponse;

void TestStatusClassification() {
  assert(ClassifyHttpStatus(200) == ApiStatus::kOk);
  assert(ClassifyHttpStatus(204) == ApiStatus::kOk);
  assert(ClassifyHttpStatus(404) == ApiStatus::kNotFound);
  assert(ClassifyHttpStatus(408) == ApiStatus::kTransient);
  assert(ClassifyHttpStatus(429) == ApiStatus::kTransient);
  assert(ClassifyHttpStatus(500) == ApiStatus::kTransient);
  assert(ClassifyHttpStatus(503) == ApiStatus::kTransient);
  assert(ClassifyHttpStatus(0) == ApiStatus::kTransient);
  assert(ClassifyHttpStatus(400) == ApiStatus::kRejected);
  assert(ClassifyHttpStatus(401) == ApiStatus::kRejected);
  assert(ClassifyHttpStatus(413) == ApiStatus::kRejected);
}

void TestSuccessfulEnvelope() {
  auto result = ParseKnowledgeResponse(200, R"({"success": true, "message": "ok",
    "data": {"id": "k-1", "parse_status": "processing", "file_hash": "abc", "file_path": "kb/k-1.pdf",
             "created_at": "2024-01-01", "tenant_id": 7}})");
  assert(result.ok());
  assert(result.knowledge.id() == "k-1");
  assert(result.knowledge.parse_status() == "processing");
  assert(result.knowledge.file_path() == "kb/k-1.pdf");
}

void TestEnvelopeWithoutSuccessFlag() {
  auto result = ParseKnowledgeResponse(200, R"({"data": {"id": "k-2", "parse_status": "failed", "error_message": "bad pdf"}})");
  assert(result.ok());
  assert(result.knowledge.error_message() == "bad pdf");
}

void TestSuccessFalseIsTransient() {
  auto result = ParseKnowledgeResponse(200, R"({"success": false, "message": "queue full"})");
  assert(result.status == ApiStatus::kTransient);
  assert(result.message == "queue full");
}

void TestMalformedBodyIsTransient() {
  auto result = ParseKnowledgeResponse(200, "<html>proxy error</html>");
  assert(result.status == ApiStatus::kTransient);
  assert(!result.message.empty());
}

void TestErrorBodiesCarryServerMessage() {
  auto rejected = ParseKnowledgeResponse(400, R"({"success": false, "message": "unsupported file type"})");
  assert(rejected.status == ApiStatus::kRejected);
  assert(rejected.message == "HTTP 400: unsupported file type");

  auto detail = ParseKnowledgeResponse(422, R"({"detail": "fileName missing"})");
  assert(detail.message == "HTTP 422: fileName missing");

  auto plain = ParseKnowledgeResponse(502, "Bad Gateway");
  assert(plain.status == ApiStatus::kTransient);
  assert(plain.message == "HTTP 502: Bad Gateway");

  auto missing = ParseKnowledgeResponse(404, "");
  assert(missing.status == ApiStatus::kNotFound);
  assert(missing.message == "HTTP 404");
}

void TestDeleteResponses() {
  assert(ParseDeleteResponse(204, "").ok());
  assert(ParseDeleteResponse(200, R"({"success": true})").ok());
  assert(ParseDeleteResponse(200, R"({"success": false, "message": "locked"})").status == ApiStatus::kTransient);
  assert(ParseDeleteResponse(404, "").status == ApiStatus::kNotFound);
  assert(ParseDeleteResponse(503, "").status == ApiStatus::kTransient);
}

} // namespace

int main() {
  TestStatusClassification();
  TestSuccessfulEnvelope();
  TestEnvelopeWithoutSuccessFlag();
  TestSuccessFalseIsTransient();
  TestMalformedBodyIsTransient();
  TestErrorBodiesCarryServerMessage();
  TestDeleteResponses();

  std::cout << "kbsync_unit_envelope: pass\n";
  return 0;
}
