#ifndef FETCHER_MEDIA_SOURCE_HPP_
#define FETCHER_MEDIA_SOURCE_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetcher {

enum class StreamLayout { AUDIO_VIDEO, AUDIO_ONLY, VIDEO_ONLY, UNKNOWN };

struct StreamDescriptor {
  uint64_t totalSizeBytes = 0;
  int64_t qualityRank = 0;  // 视频为分辨率，音频为码率
  StreamLayout layout = StreamLayout::UNKNOWN;
  std::string mimeType;
  std::string fileName;
  std::string locator;  // MediaSource 自己使用，例如实际下载地址
};

/**
 * @brief 媒体解析与传输的外部协作者
 *
 * resolve 失败抛 ResolutionError，transfer 失败抛 TransferError。
 * 两个调用都是阻塞的，由 JobRunner 放到 OffloadPool 上执行。
 * onProgress 在执行 transfer 的线程上被调用。
 */
class MediaSource {
 public:
  using ProgressCallback =
      std::function<void(uint64_t downloaded, uint64_t total)>;

  virtual ~MediaSource() = default;

  virtual std::vector<StreamDescriptor> resolve(
      const std::string& target, const std::optional<std::string>& proxy) = 0;

  // 返回保存后的文件路径
  virtual std::string transfer(const StreamDescriptor& stream,
                               const std::string& destinationDir,
                               const std::optional<std::string>& proxy,
                               const ProgressCallback& onProgress) = 0;
};

}  // namespace fetcher

#endif  // FETCHER_MEDIA_SOURCE_HPP_
