// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_transport.hpp"

#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpClient.h>
#include <aws/core/http/HttpClientFactory.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/json/JsonSerializer.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/core/utils/stream/ResponseStream.h>

#include <boost/crc.hpp>

#include <algorithm>
#include <mutex>
#include <vector>

#include "block_layout.hpp"
#include "http_transport_test_helpers.hpp"

#define RPUT_LOG_COMPONENT "http_transport"
#include <rput_log_macros.hpp>

namespace rput {
namespace uploader {

using logging::kv;

namespace {

constexpr const char* ALLOC_TAG = "rput_http_transport";
constexpr int HTTP_INVALID_CTX = 701;  // Block context unknown or expired on the server

std::string toStdString(const Aws::String& s) {
  return std::string(s.c_str(), s.size());
}

Aws::String toAwsString(const std::string& s) {
  return Aws::String(s.c_str(), s.size());
}

std::string trimTrailingSlash(std::string host) {
  while (!host.empty() && host.back() == '/') {
    host.pop_back();
  }
  return host;
}

}  // namespace

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// Aws::InitAPI/ShutdownAPI bracket every SDK use in the process. The manager
// keeps a reference count so independent factories can come and go.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Protocol encoding
// =============================================================================

std::string encodeUrlSafeBase64(const std::string& data) {
  Aws::Utils::ByteBuffer buffer(
    reinterpret_cast<const unsigned char*>(data.data()), data.size()
  );
  std::string encoded = toStdString(Aws::Utils::HashingUtils::Base64Encode(buffer));
  std::replace(encoded.begin(), encoded.end(), '+', '-');
  std::replace(encoded.begin(), encoded.end(), '/', '_');
  return encoded;
}

uint32_t chunkCrc32(const char* data, size_t size) {
  boost::crc_32_type crc;
  crc.process_bytes(data, size);
  return crc.checksum();
}

std::string buildMakeFileUrlImpl(
  const std::string& up_host, int64_t fsize, const std::string& key, bool has_key,
  const PutExtra& extra
) {
  std::string url = trimTrailingSlash(up_host) + "/mkfile/" + std::to_string(fsize);
  if (!extra.mime_type.empty()) {
    url += "/mimeType/" + encodeUrlSafeBase64(extra.mime_type);
  }
  if (has_key) {
    url += "/key/" + encodeUrlSafeBase64(key);
  }
  for (const auto& [name, value] : extra.params) {
    if (name.compare(0, 2, "x:") != 0) {
      RPUT_LOG_DEBUG("Ignoring custom param without x: prefix" << kv("name", name));
      continue;
    }
    url += "/" + name + "/" + encodeUrlSafeBase64(value);
  }
  return url;
}

std::string buildMakeFileBodyImpl(const std::vector<BlockPutResult>& progresses) {
  std::string body;
  for (size_t i = 0; i < progresses.size(); ++i) {
    if (i > 0) {
      body += ',';
    }
    body += progresses[i].ctx;
  }
  return body;
}

PutStatus statusFromHttpResponseImpl(int http_code, const std::string& body) {
  if (http_code >= 200 && http_code < 300) {
    return PutStatus::Ok();
  }

  std::string message = "http " + std::to_string(http_code);
  Aws::Utils::Json::JsonValue json(toAwsString(body));
  if (json.WasParseSuccessful() && json.View().ValueExists("error")) {
    message = toStdString(json.View().GetString("error"));
  }

  if (http_code == HTTP_INVALID_CTX) {
    return PutStatus::Failure(PutErrorCode::kInvalidContext, message, http_code);
  }
  return PutStatus::Failure(PutErrorCode::kServerError, message, http_code);
}

PutStatus parseBlockPutResponseImpl(const std::string& body, BlockPutResult& ret) {
  Aws::Utils::Json::JsonValue json(toAwsString(body));
  if (!json.WasParseSuccessful()) {
    return PutStatus::Failure(
      PutErrorCode::kBadResponse, "invalid JSON: " + toStdString(json.GetErrorMessage())
    );
  }

  auto view = json.View();
  if (!view.ValueExists("ctx") || !view.ValueExists("offset")) {
    return PutStatus::Failure(PutErrorCode::kBadResponse, "block response without ctx/offset");
  }

  BlockPutResult parsed;
  parsed.ctx = toStdString(view.GetString("ctx"));
  parsed.offset = static_cast<uint32_t>(view.GetInt64("offset"));
  if (view.ValueExists("checksum")) {
    parsed.checksum = toStdString(view.GetString("checksum"));
  }
  if (view.ValueExists("crc32")) {
    parsed.crc32 = static_cast<uint32_t>(view.GetInt64("crc32"));
  }
  if (view.ValueExists("host")) {
    parsed.host = toStdString(view.GetString("host"));
  }

  ret = parsed;
  return PutStatus::Ok();
}

PutStatus parsePutRetResponseImpl(const std::string& body, PutRet& ret) {
  ret.body = body;

  Aws::Utils::Json::JsonValue json(toAwsString(body));
  if (!json.WasParseSuccessful()) {
    return PutStatus::Failure(
      PutErrorCode::kBadResponse, "invalid JSON: " + toStdString(json.GetErrorMessage())
    );
  }

  auto view = json.View();
  if (view.ValueExists("hash")) {
    ret.hash = toStdString(view.GetString("hash"));
  }
  if (view.ValueExists("key")) {
    ret.key = toStdString(view.GetString("key"));
  }
  return PutStatus::Ok();
}

// =============================================================================
// HttpTransportFactory Implementation
// =============================================================================

class HttpTransportFactory::Impl : public IHttpPoster {
public:
  TransportConfig config;
  std::shared_ptr<Aws::Http::HttpClient> client;

  explicit Impl(const TransportConfig& cfg)
      : config(cfg) {
    AwsSdkManager::instance().addRef();

    for (auto& host : config.up_hosts) {
      host = trimTrailingSlash(host);
    }

    Aws::Client::ClientConfiguration client_config;
    client_config.verifySSL = config.verify_ssl;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client = Aws::Http::CreateHttpClient(client_config);
  }

  ~Impl() override {
    // The client must go before the SDK reference, which may call ShutdownAPI
    client.reset();
    AwsSdkManager::instance().release();
  }

  HttpReply post(const HttpPost& req) const override {
    auto request = Aws::Http::CreateHttpRequest(
      toAwsString(req.url), Aws::Http::HttpMethod::HTTP_POST,
      Aws::Utils::Stream::DefaultResponseStreamFactoryMethod
    );
    request->SetHeaderValue("Authorization", toAwsString(req.authorization));
    request->SetContentType(toAwsString(req.content_type));
    request->SetContentLength(toAwsString(std::to_string(req.body.size())));

    auto body = Aws::MakeShared<Aws::StringStream>(ALLOC_TAG);
    body->write(req.body.data(), static_cast<std::streamsize>(req.body.size()));
    request->AddContentBody(body);

    HttpReply reply;
    auto response = client->MakeRequest(request);
    if (!response || response->HasClientError() ||
        response->GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
      reply.error = response ? toStdString(response->GetClientErrorMessage())
                             : std::string("no response");
      return reply;
    }

    Aws::StringStream collected;
    collected << response->GetResponseBody().rdbuf();
    reply.sent = true;
    reply.http_code = static_cast<int>(response->GetResponseCode());
    reply.body = toStdString(collected.str());
    return reply;
  }
};

namespace {

class HttpUploadTransport : public IUploadTransport {
public:
  HttpUploadTransport(
    std::shared_ptr<const IHttpPoster> poster, std::string up_host, std::string uptoken
  )
      : poster_(std::move(poster))
      , up_host_(trimTrailingSlash(std::move(up_host)))
      , uptoken_(std::move(uptoken)) {}

  PutStatus putBlock(
    BlockPutResult& ret, const IReaderAt& reader, int blk_idx, int blk_size, const PutExtra& extra
  ) override {
    const int64_t offbase = blockOffset(blk_idx);
    const int chunk_size = extra.chunk_size > 0 ? extra.chunk_size : blk_size;
    const int try_times = extra.try_times > 0 ? extra.try_times : 1;
    std::vector<char> buffer(static_cast<size_t>(std::min(chunk_size, blk_size)));

    if (ret.ctx.empty()) {
      const size_t body_length = static_cast<size_t>(std::min(chunk_size, blk_size));
      PutStatus status = readChunk(reader, offbase, buffer.data(), body_length);
      if (!status.ok()) {
        return status;
      }

      BlockPutResult created;
      status = mkblk(created, blk_size, buffer.data(), body_length);
      if (!status.ok()) {
        return status;
      }
      if (created.crc32 != chunkCrc32(buffer.data(), body_length) ||
          created.offset != static_cast<uint32_t>(body_length)) {
        RPUT_LOG_WARN("mkblk checksum mismatch" << kv("block", blk_idx));
        return PutStatus::Failure(PutErrorCode::kUnmatchedChecksum);
      }
      ret = created;
      if (extra.notify) {
        extra.notify(blk_idx, blk_size, ret);
      }
    }

    while (ret.offset < static_cast<uint32_t>(blk_size)) {
      const size_t body_length =
        static_cast<size_t>(std::min<int64_t>(chunk_size, blk_size - static_cast<int64_t>(ret.offset)));

      PutStatus status;
      for (int attempt = 1; attempt <= try_times; ++attempt) {
        status = readChunk(reader, offbase + ret.offset, buffer.data(), body_length);
        if (!status.ok()) {
          return status;
        }
        const uint32_t crc = chunkCrc32(buffer.data(), body_length);

        BlockPutResult next;
        status = bput(ret, next, buffer.data(), body_length);
        if (status.ok()) {
          if (next.crc32 == crc) {
            ret = next;
            break;
          }
          RPUT_LOG_WARN("bput checksum mismatch" << kv("block", blk_idx) << kv("offset", ret.offset));
          status = PutStatus::Failure(PutErrorCode::kUnmatchedChecksum);
        } else if (status.code == PutErrorCode::kInvalidContext) {
          RPUT_LOG_WARN("Block context expired, block restarts" << kv("block", blk_idx));
          ret = BlockPutResult();
          return status;
        } else {
          RPUT_LOG_WARN("bput failed" << kv("block", blk_idx) << kv("error", status.message));
        }

        if (attempt < try_times) {
          RPUT_LOG_INFO("Retrying bput" << kv("block", blk_idx) << kv("attempt", attempt + 1));
        }
      }
      if (!status.ok()) {
        return status;
      }
      if (extra.notify) {
        extra.notify(blk_idx, blk_size, ret);
      }
    }

    return PutStatus::Ok();
  }

  PutStatus makeFile(
    PutRet& ret, const std::string& key, bool has_key, int64_t fsize, const PutExtra& extra
  ) override {
    const std::string url = buildMakeFileUrlImpl(upHost(), fsize, key, has_key, extra);
    const std::string body = buildMakeFileBodyImpl(extra.progresses);

    std::string response_body;
    PutStatus status =
      post(url, body.data(), body.size(), "text/plain", response_body);
    if (!status.ok()) {
      return status;
    }
    return parsePutRetResponseImpl(response_body, ret);
  }

private:
  const std::string& upHost() const {
    return up_host_;
  }

  /**
   * Send one request and map the answer to a status
   */
  PutStatus post(
    const std::string& url, const char* data, size_t size, const std::string& content_type,
    std::string& response_body
  ) const {
    HttpPost request;
    request.url = url;
    request.authorization = "UpToken " + uptoken_;
    request.content_type = content_type;
    request.body.assign(data, size);

    HttpReply reply = poster_->post(request);
    if (!reply.sent) {
      RPUT_LOG_WARN("HTTP request failed" << kv("url", url) << kv("error", reply.error));
      return PutStatus::Failure(PutErrorCode::kTransportError, reply.error);
    }
    response_body = reply.body;
    return statusFromHttpResponseImpl(reply.http_code, reply.body);
  }

  static PutStatus readChunk(const IReaderAt& reader, int64_t offset, char* buffer, size_t size) {
    size_t bytes_read = 0;
    if (!reader.readAt(buffer, size, offset, bytes_read) || bytes_read != size) {
      return PutStatus::Failure(
        PutErrorCode::kFileError, "short read at offset " + std::to_string(offset)
      );
    }
    return PutStatus::Ok();
  }

  PutStatus mkblk(BlockPutResult& ret, int blk_size, const char* data, size_t size) {
    const std::string url = upHost() + "/mkblk/" + std::to_string(blk_size);
    std::string response_body;
    PutStatus status =
      post(url, data, size, "application/octet-stream", response_body);
    if (!status.ok()) {
      return status;
    }
    return parseBlockPutResponseImpl(response_body, ret);
  }

  PutStatus bput(const BlockPutResult& current, BlockPutResult& next, const char* data, size_t size) {
    const std::string host = current.host.empty() ? upHost() : trimTrailingSlash(current.host);
    const std::string url =
      host + "/bput/" + current.ctx + "/" + std::to_string(current.offset);
    std::string response_body;
    PutStatus status =
      post(url, data, size, "application/octet-stream", response_body);
    if (!status.ok()) {
      return status;
    }
    return parseBlockPutResponseImpl(response_body, next);
  }

  std::shared_ptr<const IHttpPoster> poster_;
  std::string up_host_;
  std::string uptoken_;
};

}  // namespace

std::shared_ptr<IUploadTransport> createHttpUploadTransportImpl(
  std::shared_ptr<const IHttpPoster> poster, const std::string& up_host, const std::string& uptoken
) {
  return std::make_shared<HttpUploadTransport>(std::move(poster), up_host, uptoken);
}

HttpTransportFactory::HttpTransportFactory(const TransportConfig& config)
    : impl_(std::make_shared<Impl>(config)) {}

HttpTransportFactory::~HttpTransportFactory() = default;

std::shared_ptr<IUploadTransport> HttpTransportFactory::create(
  const std::string& uptoken, PutStatus& status
) {
  if (uptoken.empty()) {
    status = PutStatus::Failure(PutErrorCode::kInvalidArgument, "empty upload token");
    return nullptr;
  }
  if (impl_->config.up_hosts.empty() || impl_->config.up_hosts.front().empty()) {
    status = PutStatus::Failure(PutErrorCode::kInvalidArgument, "no upload host configured");
    return nullptr;
  }

  status = PutStatus::Ok();
  return createHttpUploadTransportImpl(impl_, impl_->config.up_hosts.front(), uptoken);
}

const TransportConfig& HttpTransportFactory::config() const {
  return impl_->config;
}

}  // namespace uploader
}  // namespace rput
