#include "flyg/tools/info_runner.hpp"

#include <plog/Log.h>

#include <fstream>

#include "flyg/core/flight_loader.hpp"
#include "flyg/tools/flight_summary.hpp"

namespace flyg::tools {

int RunInfo(const InfoOptions& options, std::ostream& out, std::ostream& err) {
  bool all_loaded = true;
  for (const auto& file : options.files) {
    PLOG_DEBUG << "Loading " << file;
    const auto result = flyg::core::LoadFlightInformationFromFile(file);
    if (!result.success()) {
      err << file << ": " << flyg::core::ToString(*result.error) << "\n";
      PLOG_DEBUG << file << " rejected";
      all_loaded = false;
      continue;
    }

    out << "== " << file << "\n" << FormatFlightSummary(result.recording);
    PLOG_DEBUG << file << ": " << result.recording.fuel_records.size() << " fuel records";
  }
  return all_loaded ? kExitOk : kExitLoadFailed;
}

bool CanWriteLogFile(const std::string& path) {
  std::ofstream log_stream(path, std::ios::app);
  return log_stream.is_open();
}

}  // namespace flyg::tools
