#include "http_ingestion_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/ingest/envelope.hpp"
#include "internal/observability/logging.hpp"

namespace kbsync::ingest {

namespace {

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

struct MimeDeleter {
  void operator()(curl_mime* mime) const {
    curl_mime_free(mime);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  const size_t total = size * nmemb;
  if (userdata == nullptr) return 0;
  static_cast<std::string*>(userdata)->append(ptr, total);
  return total;
}

std::string TrimTrailingSlash(std::string s) {
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

struct Response {
  CURLcode    code        = CURLE_OK;
  long        http_status = 0;
  std::string body;
};

} // namespace

HttpClientOptions HttpClientOptions::FromConfig(const kbsync::runtime::config::IngestionConfig& config) {
  return HttpClientOptions{
      .base_url           = config.base_url(),
      .api_prefix         = config.api_prefix(),
      .api_key            = config.api_key(),
      .knowledge_base_id  = config.knowledge_base_id(),
      .connect_timeout_ms = config.connect_timeout_ms(),
      .request_timeout_ms = config.request_timeout_ms(),
      .enable_multimodel  = config.enable_multimodel(),
  };
}

HttpIngestionClient::HttpIngestionClient(HttpClientOptions options) : options_(std::move(options)) {
  EnsureCurlInitialized();
}

std::string HttpIngestionClient::Url(const std::string& path) const {
  return TrimTrailingSlash(options_.base_url) + TrimTrailingSlash(options_.api_prefix) + path;
}

std::string HttpIngestionClient::KnowledgeUrl(const std::string& knowledge_id) const {
  std::string escaped = knowledge_id;
  if (char* out = curl_easy_escape(nullptr, knowledge_id.c_str(), static_cast<int>(knowledge_id.size()))) {
    escaped = out;
    curl_free(out);
  }
  return Url("/knowledge/" + escaped);
}

namespace {

// Shared transfer setup; the method-specific options are set by the caller.
CurlHandle NewHandle(const HttpClientOptions& options, const std::string& url, std::string& body) {
  CurlHandle curl(curl_easy_init());
  if (!curl) return curl;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.request_timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "kbsync/0.1");
  return curl;
}

HeaderList BuildHeaders(const HttpClientOptions& options) {
  curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");
  if (!options.api_key.empty()) {
    const std::string key_header = "X-API-Key: " + options.api_key;
    headers                      = curl_slist_append(headers, key_header.c_str());
  }
  return HeaderList(headers);
}

} // namespace

KnowledgeResult HttpIngestionClient::Submit(const UploadRequest& request) {
  KnowledgeResult result;
  if (options_.knowledge_base_id.empty()) {
    result.status  = ApiStatus::kRejected;
    result.message = "ingestion.knowledge_base_id is not configured";
    return result;
  }

  const std::string url = Url("/knowledge-bases/" + options_.knowledge_base_id + "/knowledge/file");
  Response          response;

  CurlHandle curl = NewHandle(options_, url, response.body);
  if (!curl) {
    result.status  = ApiStatus::kTransient;
    result.message = "curl_easy_init failed";
    return result;
  }

  MimeHandle     mime(curl_mime_init(curl.get()));
  curl_mimepart* part = curl_mime_addpart(mime.get());
  curl_mime_name(part, "file");
  curl_mime_data(part, request.content.data(), request.content.size());
  curl_mime_filename(part, request.file_name.c_str());
  curl_mime_type(part, "application/octet-stream");

  part = curl_mime_addpart(mime.get());
  curl_mime_name(part, "fileName");
  curl_mime_data(part, request.file_name.c_str(), CURL_ZERO_TERMINATED);

  part = curl_mime_addpart(mime.get());
  curl_mime_name(part, "enable_multimodel");
  curl_mime_data(part, options_.enable_multimodel ? "true" : "false", CURL_ZERO_TERMINATED);

  HeaderList headers = BuildHeaders(options_);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

  response.code = curl_easy_perform(curl.get());
  if (response.code != CURLE_OK) {
    result.status  = ApiStatus::kTransient;
    result.message = std::string("upload failed: ") + curl_easy_strerror(response.code);
    return result;
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.http_status);

  return ParseKnowledgeResponse(response.http_status, response.body);
}

KnowledgeResult HttpIngestionClient::GetKnowledge(const std::string& knowledge_id) {
  KnowledgeResult result;
  Response        response;

  CurlHandle curl = NewHandle(options_, KnowledgeUrl(knowledge_id), response.body);
  if (!curl) {
    result.status  = ApiStatus::kTransient;
    result.message = "curl_easy_init failed";
    return result;
  }

  HeaderList headers = BuildHeaders(options_);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

  response.code = curl_easy_perform(curl.get());
  if (response.code != CURLE_OK) {
    result.status  = ApiStatus::kTransient;
    result.message = std::string("status query failed: ") + curl_easy_strerror(response.code);
    return result;
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.http_status);

  return ParseKnowledgeResponse(response.http_status, response.body);
}

ApiResult HttpIngestionClient::DeleteKnowledge(const std::string& knowledge_id) {
  ApiResult result;
  Response  response;

  CurlHandle curl = NewHandle(options_, KnowledgeUrl(knowledge_id), response.body);
  if (!curl) {
    result.status  = ApiStatus::kTransient;
    result.message = "curl_easy_init failed";
    return result;
  }

  HeaderList headers = BuildHeaders(options_);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");

  response.code = curl_easy_perform(curl.get());
  if (response.code != CURLE_OK) {
    result.status  = ApiStatus::kTransient;
    result.message = std::string("delete failed: ") + curl_easy_strerror(response.code);
    return result;
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.http_status);

  result = ParseDeleteResponse(response.http_status, response.body);
  if (result.status == ApiStatus::kNotFound) {
    KBSYNC_LOG_DEBUG("remote knowledge already gone", {observability::StringField("knowledge_id", knowledge_id)});
  }
  return result;
}

} // namespace kbsync::ingest
