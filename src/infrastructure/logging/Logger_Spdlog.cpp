#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <pthread.h>

#include <boost/filesystem.hpp>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <ctime>

namespace fs = boost::filesystem;

namespace burrow::host::infrastructure::logging {

namespace {
constexpr const char* kContinuation = "    ";

// Every physical line ends in \r\n. Under sudo with use_pty, a bare \n from
// one of several processes sharing the terminal moves down a line without
// returning the cursor, which garbles interleaved output.
constexpr const char* kEol = "\r\n";

// Blocks SIGPIPE for the calling thread while alive, so a write to a pipe
// whose reader is gone fails with EPIPE instead of killing the process. A
// SIGPIPE raised meanwhile is consumed before the old mask comes back.
class SigpipeGuard {
 public:
  SigpipeGuard() {
    sigemptyset(&pipe_set_);
    sigaddset(&pipe_set_, SIGPIPE);

    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    was_pending_ = sigismember(&pending, SIGPIPE) == 1;

    blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
  }

  ~SigpipeGuard() {
    if (!blocked_) return;
    if (!was_pending_) {
      sigset_t pending;
      sigemptyset(&pending);
      if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
        const timespec zero{0, 0};
        while (sigtimedwait(&pipe_set_, nullptr, &zero) == -1 && errno == EINTR) {
        }
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  }

  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;

 private:
  sigset_t pipe_set_;
  sigset_t old_mask_;
  bool was_pending_{false};
  bool blocked_{false};
};

std::vector<spdlog::sink_ptr> default_sinks(const burrow::host::domain::Settings::Logging& s) {
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_sink_mt>()};
  if (!s.file.empty()) {
    const fs::path path{s.file};
    boost::system::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false));
  }
  return sinks;
}
}  // namespace

Logger_Spdlog::Logger_Spdlog(const burrow::host::domain::Settings::Logging& s)
    : Logger_Spdlog(s, default_sinks(s)) {}

Logger_Spdlog::Logger_Spdlog(const burrow::host::domain::Settings::Logging& s,
                             std::vector<spdlog::sink_ptr> sinks)
    : prefix_(s.prefix), verbosity_(s.verbosity) {
  setup(std::move(sinks));
}

// -------------------------------------------------------------------------------------------------
// setup(sinks)
//  - Builds an unregistered logger so several instances can coexist.
//  - Pattern is the bare message; prefixes are applied per line in log().
//  - Sink failures (stderr gone because the tty closed) go to a no-op handler.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::setup(std::vector<spdlog::sink_ptr> sinks) {
  logger_ = std::make_shared<spdlog::logger>("burrow", sinks.begin(), sinks.end());
  logger_->set_formatter(
      std::make_unique<spdlog::pattern_formatter>("%v", spdlog::pattern_time_type::local, kEol));
  logger_->set_level(spdlog::level::trace);
  logger_->set_error_handler([](const std::string&) {});
}

// -------------------------------------------------------------------------------------------------
// format_lines(prefix, msg)
//  - Trailing newlines are dropped, the rest is split on '\n'.
//  - First line gets the prefix, the others are indented by four spaces.
// -------------------------------------------------------------------------------------------------
std::vector<std::string> Logger_Spdlog::format_lines(std::string_view prefix, std::string_view msg) {
  while (!msg.empty() && msg.back() == '\n') msg.remove_suffix(1);

  std::vector<std::string> lines;
  std::string_view lead = prefix;
  size_t start = 0;
  while (true) {
    const size_t nl = msg.find('\n', start);
    const auto part = msg.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

    std::string line;
    line.reserve(lead.size() + part.size());
    line.append(lead).append(part);
    lines.push_back(std::move(line));
    lead = kContinuation;

    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
  return lines;
}

// -------------------------------------------------------------------------------------------------
// log(msg)
//  - Flushes stdout first so diagnostics do not overtake pending regular output.
//  - Never throws, and a closed stderr pipe never raises SIGPIPE.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::log(std::string_view msg) {
  SigpipeGuard guard;
  std::fflush(stdout);
  for (const auto& line : format_lines(prefix_, msg)) {
    logger_->log(spdlog::level::info, spdlog::string_view_t(line.data(), line.size()));
  }
  logger_->flush();
}

} // namespace burrow::host::infrastructure::logging
