#include "ffmpeg_transcoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <memory>
#include <regex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" {
  #include <libavformat/avformat.h>
  #include <libavutil/error.h>
  #include <libavutil/log.h>
}

namespace transcode_service {

namespace {

constexpr int kPollIntervalMs = 200;
constexpr const char* kSegmentContentType = "video/mp2t";
constexpr const char* kPlaylistContentType = "application/vnd.apple.mpegurl";
constexpr const char* kPlaylistName = "playlist.m3u8";

struct FormatContextDeleter {
  void operator()(AVFormatContext* ctx) const {
    if (ctx) avformat_close_input(&ctx);
  }
};
using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;

std::string avError(int code) {
  std::array<char, AV_ERROR_MAX_STRING_SIZE> buf{};
  av_strerror(code, buf.data(), buf.size());
  return buf.data();
}

// RAII: 子进程及其stderr管道, 析构时仍在运行则强制结束并回收
class ChildProcess {
public:
  ChildProcess(pid_t pid, int stderr_fd) : pid_(pid), fd_(stderr_fd) {}
  ~ChildProcess() {
    if (pid_ > 0) {
      kill();
      wait();
    }
    if (fd_ >= 0) ::close(fd_);
  }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  int fd() const { return fd_; }

  void kill() {
    if (pid_ > 0) ::kill(pid_, SIGKILL);
  }

  // exit status as returned by waitpid
  int wait() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    pid_ = -1;
    return status;
  }

private:
  pid_t pid_;
  int fd_;
};

common::Result<std::unique_ptr<ChildProcess>> spawn(const std::vector<std::string>& args) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return common::fail(common::ErrorKind::Transcode, std::string("pipe failed: ") + std::strerror(errno));
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    return common::fail(common::ErrorKind::Transcode, std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ::dup2(fds[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
    }
    ::execvp(argv[0], argv.data());
    _exit(127);
  }

  ::close(fds[1]);
  return std::make_unique<ChildProcess>(pid, fds[0]);
}

} // namespace

std::optional<TranscodeTick> parseProgressLine(std::string_view line) {
  static const std::regex time_re(R"(time=\s*(-?\d+):(\d{2}):(\d{2}(?:\.\d+)?))");
  static const std::regex frame_re(R"(frame=\s*(\d+))");
  static const std::regex speed_re(R"(speed=\s*(\d+(?:\.\d+)?)x)");

  std::string text(line);
  std::smatch m;
  if (!std::regex_search(text, m, time_re)) {
    return std::nullopt;
  }

  TranscodeTick tick;
  tick.out_time_seconds = std::stod(m[1].str()) * 3600.0 + std::stod(m[2].str()) * 60.0 + std::stod(m[3].str());
  if (tick.out_time_seconds < 0.0) {
    tick.out_time_seconds = 0.0;
  }
  if (std::regex_search(text, m, frame_re)) {
    tick.frame = std::stoll(m[1].str());
  }
  if (std::regex_search(text, m, speed_re)) {
    tick.speed = std::stod(m[1].str());
  }
  return tick;
}

common::Result<RenditionArtifacts> collectArtifacts(const std::filesystem::path& dir) {
  RenditionArtifacts artifacts{.directory = dir};

  std::error_code ec;
  for (const auto& item : std::filesystem::directory_iterator(dir, ec)) {
    if (!item.is_regular_file() || item.path().extension() != ".ts") continue;
    artifacts.segments.push_back(ArtifactFile{
      .path = item.path(),
      .name = item.path().filename().string(),
      .content_type = kSegmentContentType
    });
  }
  if (ec) {
    return common::fail(common::ErrorKind::Transcode, "cannot list " + dir.string() + ": " + ec.message());
  }
  std::sort(artifacts.segments.begin(), artifacts.segments.end(),
            [](const ArtifactFile& a, const ArtifactFile& b) { return a.name < b.name; });

  auto playlist = dir / kPlaylistName;
  if (!std::filesystem::exists(playlist, ec)) {
    return common::fail(common::ErrorKind::Transcode, "no playlist produced in " + dir.string());
  }
  if (artifacts.segments.empty()) {
    return common::fail(common::ErrorKind::Transcode, "no segments produced in " + dir.string());
  }
  artifacts.playlist = ArtifactFile{.path = playlist, .name = kPlaylistName, .content_type = kPlaylistContentType};
  return artifacts;
}

FfmpegTranscoder::FfmpegTranscoder(config::TranscodeConfig cfg) : cfg_(std::move(cfg)) {
  setLogLevel(cfg_.av_log_level);
}

void FfmpegTranscoder::setLogLevel(int loglevel) {
  av_log_set_level(loglevel);
}

common::Result<ProbeResult> FfmpegTranscoder::probe(const std::string& source_location) {
  AVFormatContext* raw = nullptr;
  if (int ret = avformat_open_input(&raw, source_location.c_str(), nullptr, nullptr); ret < 0) {
    return common::fail(common::ErrorKind::Probe, "could not open input: " + avError(ret));
  }
  FormatContextPtr input{raw};

  if (int ret = avformat_find_stream_info(input.get(), nullptr); ret < 0) {
    return common::fail(common::ErrorKind::Probe, "could not find stream info: " + avError(ret));
  }

  int index = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    return common::fail(common::ErrorKind::Probe, "could not find video stream");
  }
  const AVStream* stream = input->streams[index];

  ProbeResult result;
  result.width = stream->codecpar->width;
  result.height = stream->codecpar->height;
  if (input->duration != AV_NOPTS_VALUE) {
    result.duration_seconds = static_cast<double>(input->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE) {
    result.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  }
  result.bitrate = stream->codecpar->bit_rate > 0 ? stream->codecpar->bit_rate : input->bit_rate;

  if (result.width <= 0 || result.height <= 0) {
    return common::fail(common::ErrorKind::Probe, "video stream has no dimensions");
  }
  return result;
}

std::vector<std::string> FfmpegTranscoder::buildArguments(const std::string& source_location,
                                                          const RenditionSpec& spec,
                                                          const std::filesystem::path& work_dir) const {
  return {
    cfg_.ffmpeg_bin,
    "-nostdin",
    "-y",
    "-fflags", "+discardcorrupt",
    "-i", source_location,
    "-vf", std::format("scale=-2:{}", spec.height),
    "-c:v", "libx264",
    "-preset", cfg_.preset,
    "-crf", std::to_string(cfg_.crf),
    "-c:a", "aac",
    "-b:a", std::format("{}k", spec.audio_bitrate_kbps),
    "-f", "hls",
    "-hls_time", std::to_string(cfg_.hls_segment_seconds),
    "-hls_playlist_type", "vod",
    "-hls_segment_type", "mpegts",
    "-hls_segment_filename", (work_dir / "segment_%03d.ts").string(),
    "-hls_flags", "independent_segments",
    "-start_number", "0",
    (work_dir / kPlaylistName).string()
  };
}

common::Result<RenditionArtifacts> FfmpegTranscoder::transcode(const std::string& source_location,
                                                               const RenditionSpec& spec,
                                                               const std::filesystem::path& work_dir,
                                                               const TickSink& on_tick,
                                                               const TranscodeControl& control) {
  auto child = spawn(buildArguments(source_location, spec, work_dir));
  if (!child) {
    return std::unexpected(child.error());
  }
  spdlog::info("[>] running {} for {}", cfg_.ffmpeg_bin, spec.label);

  std::string pending;      // partial line
  std::string last_message; // last non-progress line, reported on failure
  std::array<char, 4096> buf{};

  auto consume = [&](std::string_view line) {
    if (line.empty()) return;
    if (auto tick = parseProgressLine(line)) {
      if (on_tick) on_tick(*tick);
    } else {
      last_message.assign(line);
    }
  };

  while (true) {
    if (control.stop.stop_requested()) {
      (*child)->kill();
      return common::fail(common::ErrorKind::Cancelled, "ffmpeg stopped on shutdown");
    }
    if (control.deadline && std::chrono::steady_clock::now() >= *control.deadline) {
      (*child)->kill();
      return common::fail(common::ErrorKind::Timeout, "ffmpeg exceeded the job deadline");
    }

    pollfd pfd{.fd = (*child)->fd(), .events = POLLIN, .revents = 0};
    int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      return common::fail(common::ErrorKind::Transcode, std::string("poll failed: ") + std::strerror(errno));
    }
    if (ready == 0) continue;

    ssize_t n = ::read((*child)->fd(), buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return common::fail(common::ErrorKind::Transcode, std::string("read failed: ") + std::strerror(errno));
    }
    if (n == 0) break;

    // ffmpeg用\r刷新进度行
    for (ssize_t i = 0; i < n; ++i) {
      char c = buf[static_cast<size_t>(i)];
      if (c == '\r' || c == '\n') {
        consume(pending);
        pending.clear();
      } else {
        pending.push_back(c);
      }
    }
  }
  consume(pending);

  int status = (*child)->wait();
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    auto code = WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status);
    return common::fail(common::ErrorKind::Transcode,
                        std::format("ffmpeg exited with code {}: {}", code, last_message));
  }
  return collectArtifacts(work_dir);
}

} // namespace transcode_service
