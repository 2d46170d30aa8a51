#pragma once

#include <string>

#include "flyg/core/flight_recording.hpp"

namespace flyg::tools {

/**
 * @brief Формирует текстовую сводку по записи полёта для вывода в консоль.
 * @param recording Запись после успешной загрузки.
 * @return std::string Многострочный текст сводки.
 * @note Для пустого списка замеров топлива выводится "(no fuel records)".
 */
std::string FormatFlightSummary(const flyg::core::FlightRecording& recording);

}  // namespace flyg::tools
