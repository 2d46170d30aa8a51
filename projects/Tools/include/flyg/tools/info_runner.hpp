#pragma once

#include <ostream>
#include <string>

#include "flyg/tools/command_line.hpp"

namespace flyg::tools {

/// @brief Код выхода: все файлы загружены.
constexpr int kExitOk = 0;
/// @brief Код выхода: хотя бы один файл не загрузился.
constexpr int kExitLoadFailed = 1;
/// @brief Код выхода: неверные аргументы или недоступный лог-файл.
constexpr int kExitUsage = 2;

/**
 * @brief Загружает каждый файл из options.files и печатает сводку или ошибку.
 * @param options Разобранные параметры запуска.
 * @param out Поток для сводок (stdout у flyg_info).
 * @param err Поток для сообщений об ошибках вида "<файл>: <описание>" (stderr у flyg_info).
 * @return int kExitOk, если все файлы загружены, иначе kExitLoadFailed.
 * @note Ошибка одного файла не прерывает обработку остальных.
 */
int RunInfo(const InfoOptions& options, std::ostream& out, std::ostream& err);

/**
 * @brief Проверяет, что лог-файл можно открыть на дозапись.
 * @param path Путь к лог-файлу.
 * @return bool false, если каталог отсутствует или файл не открывается.
 * @note plog открывает файл лениво и ошибок не сообщает, поэтому проверка делается заранее.
 */
bool CanWriteLogFile(const std::string& path);

}  // namespace flyg::tools
