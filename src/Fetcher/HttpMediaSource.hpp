#ifndef FETCHER_HTTP_MEDIA_SOURCE_HPP_
#define FETCHER_HTTP_MEDIA_SOURCE_HPP_

#include <string>

#include "MediaSource.hpp"

namespace fetcher {

// 直接 HTTP(S) 地址的 MediaSource：HEAD 得到一个流，GET 保存到目录
class HttpMediaSource : public MediaSource {
 public:
  struct Options {
    long connectTimeoutSec = 30;
    std::string userAgent = "media-fetcher/1.0";
  };

  HttpMediaSource();
  explicit HttpMediaSource(Options options);
  ~HttpMediaSource() override = default;

  std::vector<StreamDescriptor> resolve(
      const std::string& target,
      const std::optional<std::string>& proxy) override;

  std::string transfer(const StreamDescriptor& stream,
                       const std::string& destinationDir,
                       const std::optional<std::string>& proxy,
                       const ProgressCallback& onProgress) override;

  static bool isHttpUrl(const std::string& url);
  // 取 URL 路径最后一段（去掉 query/fragment），为空时返回 "download"
  static std::string fileNameFromUrl(const std::string& url);
  // video/* -> AUDIO_VIDEO，audio/* -> AUDIO_ONLY，其余 UNKNOWN
  static StreamLayout layoutFromContentType(const std::string& contentType);

 private:
  Options options_;
};

}  // namespace fetcher

#endif  // FETCHER_HTTP_MEDIA_SOURCE_HPP_
