#ifndef D15C07E0_5B2D_4D62_BA2E_BB3B1E921DEC
#define D15C07E0_5B2D_4D62_BA2E_BB3B1E921DEC

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace drawer::logging {
typedef std::shared_ptr<spdlog::logger> Logger;
typedef std::function<void(Logger)> LoggerInit;

// Returns the logger registered under name, creating it on first use
//  init runs once on creation, before the environment overrides are applied:
//  LOG_<name> / LOG for the level, LOG_<name>_FORMAT / LOG_FORMAT for the pattern
Logger getOrCreate(const std::string &name, const LoggerInit &init = LoggerInit{});

// Logger for one of the drawer subsystems (anim, input, ui)
Logger getSubsystemLogger(const std::string &name, spdlog::level::level_enum defaultLevel);

// Points this logger at the shared output sinks
void initSinks(Logger logger);
void initLogLevel(Logger logger);
void initLogFormat(Logger logger);

// Replaces the stderr and file outputs of every logger with the given sinks
void redirectAll(const std::vector<spdlog::sink_ptr> &sinks);

// Filter level of the shared output sinks
spdlog::level::level_enum getSinkLevel();
void setSinkLevel(spdlog::level::level_enum level);

// Installs the default "drawer" logger once, an empty fileName disables the log file
void setupDefaultLoggerConditional(std::string fileName);
} // namespace drawer::logging

#endif /* D15C07E0_5B2D_4D62_BA2E_BB3B1E921DEC */
