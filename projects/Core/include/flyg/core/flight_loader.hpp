#pragma once

#include <filesystem>
#include <optional>

#include "flyg/core/flight_recording.hpp"
#include "flyg/core/format_error.hpp"

namespace flyg::core {

/**
 * @brief Результат загрузки записи полёта.
 * @param recording Заполненная запись, если загрузка прошла успешно.
 * @param error Вид ошибки при неудаче.
 * @note При ошибке recording остаётся пустой: частичных результатов нет.
 */
struct FlightLoadResult {
  FlightRecording recording;
  std::optional<FormatError> error;

  [[nodiscard]] bool success() const { return !error.has_value(); }
};

/**
 * @brief Загружает запись полёта из JSON-файла, сжатого gzip или несжатого.
 * @param path Путь к файлу записи.
 * @return FlightLoadResult Запись или один из трёх видов FormatError.
 * @note Способ чтения выбирается только по расширению: "gz" в любом регистре означает gzip.
 * @warning Сжатый файл без расширения "gz" будет отклонён как kFileFormatNotRecognized.
 */
FlightLoadResult LoadFlightInformationFromFile(const std::filesystem::path& path);

/**
 * @brief Проверяет, зарезервировано ли расширение файла за сжатым форматом.
 * @param path Путь к файлу; смотрится подстрока после последней точки в имени.
 * @return bool true для расширения "gz" в любом регистре.
 * @note Не зависит от того, собрана ли поддержка сжатия.
 */
bool IsCompressedFlightPath(const std::filesystem::path& path);

/// @brief Сообщает, собрана ли библиотека с поддержкой gzip.
bool CompressionSupported();

}  // namespace flyg::core
