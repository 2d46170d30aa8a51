#include "flyg/core/flight_loader.hpp"
#include "flyg/tools/command_line.hpp"
#include "flyg/tools/info_runner.hpp"

#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Initializers/RollingFileInitializer.h>
#include <plog/Log.h>

#include <cstddef>
#include <iostream>
#include <string>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr int kMaxLogFiles = 3;

/**
 * @brief Инициализирует plog: консоль и, если задан, кольцевой лог-файл.
 * @param options Параметры запуска.
 * @return bool false, если лог-файл не открывается на запись.
 * @note Консольный appender статический и живёт до конца процесса.
 */
bool InitLogging(const flyg::tools::InfoOptions& options) {
  static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
  const plog::Severity severity = options.verbose ? plog::debug : plog::warning;

  if (options.log_file.empty()) {
    plog::init(severity, &console_appender);
    return true;
  }

  if (!flyg::tools::CanWriteLogFile(options.log_file)) {
    std::cerr << "Could not open log file " << options.log_file << "\n";
    return false;
  }
  plog::init(severity, options.log_file.c_str(), kMaxLogFileSize, kMaxLogFiles)
      .addAppender(&console_appender);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program = argc > 0 ? argv[0] : "flyg_info";

  flyg::tools::InfoOptions options;
  std::string error;
  if (!flyg::tools::ParseCommandLine(argc, argv, &options, &error)) {
    std::cerr << error << "\n" << flyg::tools::UsageText(program);
    return flyg::tools::kExitUsage;
  }
  if (options.show_help) {
    std::cout << flyg::tools::UsageText(program);
    return flyg::tools::kExitOk;
  }
  if (!InitLogging(options)) {
    return flyg::tools::kExitUsage;
  }

  PLOG_DEBUG << "gzip support: " << (flyg::core::CompressionSupported() ? "on" : "off");
  return flyg::tools::RunInfo(options, std::cout, std::cerr);
}
