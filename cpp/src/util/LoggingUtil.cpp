#include "util/LoggingUtil.hpp"

#include "util/Exceptions.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

namespace {

spdlog::level::level_enum parse_level(const std::string& name) {
  spdlog::level::level_enum level = spdlog::level::from_str(name);

  // from_str() maps anything it does not recognize to off
  if (level == spdlog::level::off && name != "off") {
    throw util::CleanException("Unknown log level: '{}'", name);
  }
  return level;
}

}  // namespace

void Logging::init(const Params& params) {
  spdlog::level::level_enum level = parse_level(params.log_level);
  const char* pattern = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  std::vector<spdlog::sink_ptr> sinks;

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern(pattern);
  sinks.push_back(console_sink);

  if (!params.log_filename.empty()) {
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    try {
      file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename,
                                                                      !params.append_mode);
    } catch (const spdlog::spdlog_ex& e) {
      throw util::CleanException("Cannot open log file '{}': {}", params.log_filename, e.what());
    }
    file_sink->set_pattern(pattern);
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("tictactoe", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::debug);
  spdlog::set_default_logger(logger);
}

}  // namespace util
