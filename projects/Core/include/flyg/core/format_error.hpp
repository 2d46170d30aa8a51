#pragma once

#include <string_view>

namespace flyg::core {

/**
 * @brief Закрытый набор причин, по которым файл полёта не был загружен.
 * @note Подробности исходной ошибки (код ОС, позиция в документе) не сохраняются.
 */
enum class FormatError {
  kCouldNotOpenFile,
  kFileFormatNotRecognized,
  kDecompressionFailed,
};

/**
 * @brief Возвращает человекочитаемое описание ошибки.
 * @param error Вид ошибки.
 * @return std::string_view Строка со статическим временем жизни.
 */
std::string_view ToString(FormatError error);

}  // namespace flyg::core
