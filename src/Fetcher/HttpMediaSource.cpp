#include "HttpMediaSource.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "Errors.hpp"
#include "logger.hpp"

namespace fetcher {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }
    std::atexit([] { curl_global_cleanup(); });
  });
}

struct TransferContext {
  std::ofstream* ofs;
  const MediaSource::ProgressCallback* onProgress;
  uint64_t fallbackTotal;
};

// 写入回调，返回值小于 size * nmemb 时 curl 以 CURLE_WRITE_ERROR 结束
size_t write_data(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  ctx->ofs->write(static_cast<char*>(ptr), size * nmemb);
  return ctx->ofs->good() ? size * nmemb : 0;
}

int xfer_info(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  auto* ctx = static_cast<TransferContext*>(clientp);
  if (*ctx->onProgress) {
    uint64_t total =
        dltotal > 0 ? static_cast<uint64_t>(dltotal) : ctx->fallbackTotal;
    uint64_t now = dlnow > 0 ? static_cast<uint64_t>(dlnow) : 0;
    if (total > 0) (*ctx->onProgress)(std::min(now, total), total);
  }
  return 0;
}

CurlHandle newHandle(const std::string& url,
                     const std::optional<std::string>& proxy,
                     const HttpMediaSource::Options& options) {
  CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) return curl;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   options.connectTimeoutSec);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.userAgent.c_str());
  if (proxy && !proxy->empty()) {
    // 同一个代理用于 http 和 https
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, proxy->c_str());
  }
  return curl;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

HttpMediaSource::HttpMediaSource() : HttpMediaSource(Options()) {}

HttpMediaSource::HttpMediaSource(Options options)
    : options_(std::move(options)) {
  ensureCurlInitialized();
}

bool HttpMediaSource::isHttpUrl(const std::string& url) {
  const std::string l = lower(url);
  auto hasHost = [&l](size_t schemeLen) {
    return l.size() > schemeLen && l[schemeLen] != '/';
  };
  if (l.rfind("http://", 0) == 0) return hasHost(7);
  if (l.rfind("https://", 0) == 0) return hasHost(8);
  return false;
}

std::string HttpMediaSource::fileNameFromUrl(const std::string& url) {
  std::string path = url;
  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) path.erase(cut);
  auto scheme = path.find("://");
  if (scheme != std::string::npos) {
    auto slash = path.find('/', scheme + 3);
    path = slash == std::string::npos ? std::string() : path.substr(slash);
  }
  auto last = path.find_last_of('/');
  std::string name = last == std::string::npos ? path : path.substr(last + 1);
  if (name.empty() || name == "." || name == "..") return "download";
  return name;
}

StreamLayout HttpMediaSource::layoutFromContentType(
    const std::string& contentType) {
  const std::string type = lower(contentType);
  if (type.rfind("video/", 0) == 0) return StreamLayout::AUDIO_VIDEO;
  if (type.rfind("audio/", 0) == 0) return StreamLayout::AUDIO_ONLY;
  return StreamLayout::UNKNOWN;
}

std::vector<StreamDescriptor> HttpMediaSource::resolve(
    const std::string& target, const std::optional<std::string>& proxy) {
  if (!isHttpUrl(target)) {
    throw ResolutionError("Not an http(s) URL: " + target);
  }
  CurlHandle curl = newHandle(target, proxy, options_);
  if (!curl) {
    throw ResolutionError("curl_easy_init failed");
  }
  curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HEADER, 0L);

  LOG(INFO) << "[HttpMediaSource] Resolving " << target;
  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw ResolutionError(curl_easy_strerror(res));
  }
  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code >= 400) {
    throw ResolutionError("HTTP error: " + std::to_string(http_code));
  }

  curl_off_t length = -1;
  curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  char* content_type = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
  char* effective_url = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);

  StreamDescriptor stream;
  stream.totalSizeBytes = length > 0 ? static_cast<uint64_t>(length) : 0;
  stream.mimeType = content_type ? content_type : "";
  stream.layout = layoutFromContentType(stream.mimeType);
  stream.locator = effective_url ? effective_url : target;
  stream.fileName = fileNameFromUrl(stream.locator);
  LOG(INFO) << "[HttpMediaSource] " << target << " -> " << stream.mimeType
            << ", " << stream.totalSizeBytes << " bytes, file "
            << stream.fileName;
  return {stream};
}

std::string HttpMediaSource::transfer(const StreamDescriptor& stream,
                                      const std::string& destinationDir,
                                      const std::optional<std::string>& proxy,
                                      const ProgressCallback& onProgress) {
  const std::string path =
      (std::filesystem::path(destinationDir) / stream.fileName).string();
  CurlHandle curl = newHandle(stream.locator, proxy, options_);
  if (!curl) {
    throw TransferError("curl_easy_init failed");
  }
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw TransferError("Failed to open output file: " + path);
  }

  TransferContext ctx{&ofs, &onProgress, stream.totalSizeBytes};
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xfer_info);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

  LOG(INFO) << "[HttpMediaSource] Downloading " << stream.locator << " to "
            << path;
  CURLcode res = curl_easy_perform(curl.get());
  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  ofs.close();

  std::string error;
  if (res != CURLE_OK) {
    error = curl_easy_strerror(res);
  } else if (http_code >= 400) {
    error = "HTTP error: " + std::to_string(http_code);
  } else if (ofs.fail()) {
    error = "Failed to write output file: " + path;
  }
  if (!error.empty()) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw TransferError(error);
  }
  LOG(INFO) << "[HttpMediaSource] " << path << " done.";
  return path;
}

}  // namespace fetcher
