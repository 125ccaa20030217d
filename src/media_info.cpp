/**
 * @file media_info.cpp
 * @brief libavformat container inspection implementation
 */

#include "cam_merge/media_info.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include "cam_merge/logging.hpp"

namespace cam_merge {

namespace {

/// Owns an opened AVFormatContext
class InputContext {
public:
  InputContext() = default;
  ~InputContext() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  InputContext(const InputContext &) = delete;
  InputContext &operator=(const InputContext &) = delete;

  int open(const std::string &path) {
    return avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr);
  }

  AVFormatContext *get() const { return ctx_; }

private:
  AVFormatContext *ctx_ = nullptr;
};

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

void quiet_libav_logging() { av_log_set_level(AV_LOG_ERROR); }

std::optional<MediaSummary> probe_media(const std::string &path) {
  InputContext input;

  int ret = input.open(path);
  if (ret < 0) {
    LOG_WARN("avformat_open_input failed for {}: {}", path,
             av_error_string(ret));
    return std::nullopt;
  }

  ret = avformat_find_stream_info(input.get(), nullptr);
  if (ret < 0) {
    LOG_WARN("avformat_find_stream_info failed for {}: {}", path,
             av_error_string(ret));
    return std::nullopt;
  }

  AVFormatContext *fmt_ctx = input.get();
  if (fmt_ctx->duration == AV_NOPTS_VALUE || fmt_ctx->duration <= 0)
    return std::nullopt;

  MediaSummary summary;
  summary.duration_seconds =
      static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;

  int video = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr,
                                  0);
  if (video >= 0) {
    const AVCodecParameters *par = fmt_ctx->streams[video]->codecpar;
    summary.video_codec = avcodec_get_name(par->codec_id);
    summary.width = par->width;
    summary.height = par->height;
  }

  return summary;
}

} // namespace cam_merge
