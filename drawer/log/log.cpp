#include "log.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <magic_enum.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace drawer::logging {

static constexpr const char *DefaultPattern = "[%d/%m %T.%e][%n]%^[%l]%$[%s::%#] %v";

typedef std::optional<spdlog::level::level_enum> OptionalLevel;

// Compile time levels, set from the build with -DDRAWER_DEFAULT_*_LOG_LEVEL=<spdlog level number>
#ifdef DRAWER_DEFAULT_LOG_LEVEL
static constexpr OptionalLevel BuildLoggerLevel = spdlog::level::level_enum(DRAWER_DEFAULT_LOG_LEVEL);
#else
static constexpr OptionalLevel BuildLoggerLevel = std::nullopt;
#endif
#ifdef DRAWER_DEFAULT_STDERR_LOG_LEVEL
static constexpr OptionalLevel BuildStdErrLevel = spdlog::level::level_enum(DRAWER_DEFAULT_STDERR_LOG_LEVEL);
#else
static constexpr OptionalLevel BuildStdErrLevel = std::nullopt;
#endif
#ifdef DRAWER_DEFAULT_FILE_LOG_LEVEL
static constexpr OptionalLevel BuildFileLevel = spdlog::level::level_enum(DRAWER_DEFAULT_FILE_LOG_LEVEL);
#else
static constexpr OptionalLevel BuildFileLevel = std::nullopt;
#endif

// Looks up the variable as given, then lower case, then upper case
static const char *getEnvVar(std::string name) {
  if (const char *val = std::getenv(name.c_str()))
    return val;
  boost::algorithm::to_lower(name);
  if (const char *val = std::getenv(name.c_str()))
    return val;
  boost::algorithm::to_upper(name);
  return std::getenv(name.c_str());
}

static OptionalLevel getEnvLevel(const std::string &name) {
  const char *val = getEnvVar(name);
  if (!val)
    return std::nullopt;
  auto level = magic_enum::enum_cast<spdlog::level::level_enum>(val);
  if (!level)
    spdlog::warn("Ignoring {}={}, not a log level", name, val);
  return level;
}

// Most verbose of the compile time levels
static OptionalLevel getBuildLevel() {
  if (BuildLoggerLevel)
    return BuildLoggerLevel;
  OptionalLevel level;
  for (auto &sinkLevel : {BuildStdErrLevel, BuildFileLevel}) {
    if (sinkLevel)
      level = std::min(level.value_or(spdlog::level::info), *sinkLevel);
  }
  return level;
}

// Shared by every logger: one dist sink fanning out to stderr and the optional log file
struct Outputs {
  std::mutex lock;
  std::shared_ptr<spdlog::sinks::dist_sink_mt> dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stdErr;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
  // Set once a level came from the environment, compile time sink levels no longer apply
  bool envOverride{};

  Outputs() {
    resetStdErr();
    if (auto level = getEnvLevel("LOG_STDERR_FILTER")) {
      stdErr->set_level(*level);
      envOverride = true;
    }
  }

  void resetStdErr() {
    if (stdErr)
      dist->remove_sink(stdErr);
    stdErr = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    if (BuildStdErrLevel && !envOverride)
      stdErr->set_level(*BuildStdErrLevel);
    dist->add_sink(stdErr);
  }

  void openFile(const std::string &fileName) {
    if (file)
      dist->remove_sink(file);
    file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(boost::filesystem::absolute(fileName).string(), true);
    if (BuildFileLevel && !envOverride)
      file->set_level(*BuildFileLevel);
    dist->add_sink(file);
  }

  void applyEnvOverride() {
    if (envOverride)
      return;
    envOverride = true;
    for (auto &sink : dist->sinks())
      sink->set_level(spdlog::level::trace);
  }
};

static Outputs &getOutputs() {
  static Outputs outputs;
  return outputs;
}

Logger getOrCreate(const std::string &name, const LoggerInit &init) {
  static std::mutex registerLock;
  std::unique_lock<std::mutex> l(registerLock);
  if (auto logger = spdlog::get(name))
    return logger;

  auto logger = std::make_shared<spdlog::logger>(name);
  if (init)
    init(logger);
  logger->flush_on(spdlog::level::err);
  initLogLevel(logger);
  initLogFormat(logger);
  initSinks(logger);
  spdlog::register_logger(logger);
  return logger;
}

Logger getSubsystemLogger(const std::string &name, spdlog::level::level_enum defaultLevel) {
  return getOrCreate(name, [=](Logger logger) { logger->set_level(defaultLevel); });
}

void initLogLevel(Logger logger) {
  // Specific variable first, then the global one
  auto level = getEnvLevel(fmt::format("LOG_{}", logger->name()));
  if (!level)
    level = getEnvLevel("LOG");

  if (level) {
    {
      auto &outputs = getOutputs();
      std::unique_lock<std::mutex> l(outputs.lock);
      outputs.applyEnvOverride();
    }
    logger->set_level(*level);
  } else if (auto buildLevel = getBuildLevel()) {
    logger->set_level(*buildLevel);
  }
}

void initLogFormat(Logger logger) {
  const char *pattern = getEnvVar(fmt::format("LOG_{}_FORMAT", logger->name()));
  if (!pattern)
    pattern = getEnvVar("LOG_FORMAT");
  logger->set_pattern(pattern ? pattern : DefaultPattern);
}

void initSinks(Logger logger) {
  logger->sinks().clear();
  logger->sinks().push_back(getOutputs().dist);
}

void redirectAll(const std::vector<spdlog::sink_ptr> &sinks) {
  auto &outputs = getOutputs();
  std::unique_lock<std::mutex> l(outputs.lock);
  outputs.dist->set_sinks(sinks);
  outputs.stdErr.reset();
  outputs.file.reset();
}

spdlog::level::level_enum getSinkLevel() { return getOutputs().dist->level(); }

void setSinkLevel(spdlog::level::level_enum level) { getOutputs().dist->set_level(level); }

void setupDefaultLoggerConditional(std::string fileName) {
  static std::once_flag once;
  std::call_once(once, [&]() {
    auto &outputs = getOutputs();
    {
      std::unique_lock<std::mutex> l(outputs.lock);
      if (!fileName.empty())
        outputs.openFile(fileName);
      // The stderr handle may have changed since startup
      outputs.resetStdErr();
    }

    auto logger = std::make_shared<spdlog::logger>("drawer", outputs.dist);
    logger->flush_on(spdlog::level::err);
    initLogLevel(logger);
    initLogFormat(logger);
    spdlog::set_default_logger(logger);

    // Filtering happens per logger, let everything through the shared sink
    setSinkLevel(spdlog::level::trace);

    // Loggers created before this point still point at stale outputs
    spdlog::apply_all([](Logger existing) { initSinks(existing); });
  });
}

} // namespace drawer::logging
