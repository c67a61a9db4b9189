#include "envelope.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace kbsync::ingest {

namespace {

constexpr std::size_t kMaxBodyInMessage = 200;

bool ParseEnvelope(std::string_view body, kbsync::ingest::v1::KnowledgeEnvelope& envelope, std::string& error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(body), &envelope, options);
  if (!status.ok()) {
    error = std::string(status.message());
    return false;
  }
  return true;
}

// FastAPI-style errors carry "detail" instead of "message".
std::string ErrorText(long http_status, std::string_view body) {
  google::protobuf::Struct                 parsed;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  if (!body.empty() && google::protobuf::util::JsonStringToMessage(std::string(body), &parsed, options).ok()) {
    for (const char* key : {"message", "detail", "error"}) {
      auto it = parsed.fields().find(key);
      if (it != parsed.fields().end() && it->second.has_string_value() && !it->second.string_value().empty()) {
        return "HTTP " + std::to_string(http_status) + ": " + it->second.string_value();
      }
    }
  }

  std::string text = "HTTP " + std::to_string(http_status);
  if (!body.empty()) {
    text += ": ";
    text += body.substr(0, kMaxBodyInMessage);
  }
  return text;
}

} // namespace

const char* ToString(ApiStatus status) {
  switch (status) {
    case ApiStatus::kOk:
      return "ok";
    case ApiStatus::kNotFound:
      return "not_found";
    case ApiStatus::kTransient:
      return "transient";
    case ApiStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

ApiStatus ClassifyHttpStatus(long http_status) {
  if (http_status >= 200 && http_status < 300) return ApiStatus::kOk;
  if (http_status == 404) return ApiStatus::kNotFound;
  if (http_status == 408 || http_status == 429 || http_status >= 500) return ApiStatus::kTransient;
  // no status line at all counts as a broken connection
  if (http_status <= 0) return ApiStatus::kTransient;
  return ApiStatus::kRejected;
}

KnowledgeResult ParseKnowledgeResponse(long http_status, std::string_view body) {
  KnowledgeResult result;
  result.http_status = http_status;
  result.status      = ClassifyHttpStatus(http_status);

  if (result.status != ApiStatus::kOk) {
    result.message = ErrorText(http_status, body);
    return result;
  }

  kbsync::ingest::v1::KnowledgeEnvelope envelope;
  std::string                           error;
  if (!ParseEnvelope(body, envelope, error)) {
    result.status  = ApiStatus::kTransient;
    result.message = "malformed response: " + error;
    return result;
  }

  if (envelope.has_success() && !envelope.success()) {
    result.status  = ApiStatus::kTransient;
    result.message = envelope.message().empty() ? "request not successful" : envelope.message();
    return result;
  }

  result.knowledge = envelope.data();
  return result;
}

ApiResult ParseDeleteResponse(long http_status, std::string_view body) {
  ApiResult result;
  result.http_status = http_status;
  result.status      = ClassifyHttpStatus(http_status);

  if (result.status != ApiStatus::kOk) {
    result.message = ErrorText(http_status, body);
    return result;
  }

  // an empty 2xx body (204) is a plain success
  if (body.empty()) return result;

  kbsync::ingest::v1::KnowledgeEnvelope envelope;
  std::string                           error;
  if (ParseEnvelope(body, envelope, error) && envelope.has_success() && !envelope.success()) {
    result.status  = ApiStatus::kTransient;
    result.message = envelope.message().empty() ? "delete not successful" : envelope.message();
  }
  return result;
}

} // namespace kbsync::ingest
