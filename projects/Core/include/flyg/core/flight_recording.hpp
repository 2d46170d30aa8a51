#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flyg::core {

/**
 * @brief Статические данные самолёта, на котором выполнялся полёт.
 * @param name Название самолёта (как его сообщает симулятор).
 * @param fuel_capacity Полная ёмкость топливных баков, галлоны.
 * @param number_of_engines Количество двигателей.
 * @param fuel_weight Вес топлива, фунты на галлон.
 * @param unusable_fuel_quantity Невырабатываемый остаток топлива, галлоны.
 * @note Поля fuel_weight и unusable_fuel_quantity появились в расширенной схеме и по умолчанию равны 0.
 */
struct PlaneInformation {
  std::string name;
  std::uint32_t fuel_capacity{};
  std::uint8_t number_of_engines{};
  double fuel_weight{};
  double unusable_fuel_quantity{};
};

/**
 * @brief Четыре границы фаз полёта в текстовом виде.
 * @param block_off_time Начало движения самолёта (уход с колодок).
 * @param takeoff_time Отрыв от полосы.
 * @param landing_time Касание полосы.
 * @param block_on_time Остановка на стоянке и выключение двигателей.
 * @warning Хронологический порядок не проверяется.
 */
struct Times {
  std::string block_off_time;
  std::string takeoff_time;
  std::string landing_time;
  std::string block_on_time;
};

/// @brief Один замер остатка топлива, галлоны.
struct FuelRecord {
  double fuel_quantity{};
};

/**
 * @brief Корневая запись полёта.
 * @param plane_information Данные самолёта.
 * @param landing_speed Скорость касания, футы в секунду.
 * @param times Времена фаз полёта.
 * @param fuel_records Замеры топлива в порядке их снятия; может быть пустым.
 */
struct FlightRecording {
  PlaneInformation plane_information{};
  double landing_speed{};
  Times times{};
  std::vector<FuelRecord> fuel_records;
};

}  // namespace flyg::core
