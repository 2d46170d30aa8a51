#include "flyg/tools/flight_summary.hpp"

#include <iomanip>
#include <sstream>

namespace flyg::tools {
namespace {

void AppendTimes(std::ostringstream& oss, const flyg::core::Times& times) {
  oss << "Block off: " << times.block_off_time << "\n";
  oss << "Takeoff: " << times.takeoff_time << "\n";
  oss << "Landing: " << times.landing_time << "\n";
  oss << "Block on: " << times.block_on_time << "\n";
}

}  // namespace

std::string FormatFlightSummary(const flyg::core::FlightRecording& recording) {
  const auto& plane = recording.plane_information;
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);

  oss << "Plane: " << plane.name << "\n";
  // uint8_t выводится как символ без приведения.
  oss << "Engines: " << static_cast<unsigned>(plane.number_of_engines) << "\n";
  oss << "Fuel capacity: " << plane.fuel_capacity << " gal\n";
  oss << "Fuel weight: " << plane.fuel_weight << " lb/gal\n";
  oss << "Unusable fuel: " << plane.unusable_fuel_quantity << " gal\n";
  oss << "Landing speed: " << recording.landing_speed << " ft/s\n";
  AppendTimes(oss, recording.times);

  const auto& records = recording.fuel_records;
  if (records.empty()) {
    oss << "  (no fuel records)\n";
    return oss.str();
  }
  oss << "Fuel records: " << records.size() << " | First " << records.front().fuel_quantity
      << " gal | Last " << records.back().fuel_quantity << " gal\n";
  return oss.str();
}

}  // namespace flyg::tools
