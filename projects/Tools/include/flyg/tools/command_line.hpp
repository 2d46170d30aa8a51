#pragma once

#include <string>
#include <vector>

namespace flyg::tools {

/**
 * @brief Параметры запуска flyg_info.
 * @param files Файлы полётов для загрузки, в порядке командной строки.
 * @param log_file Путь к кольцевому лог-файлу; пустой, если лог в файл не нужен.
 * @param verbose Включает отладочный уровень логирования.
 * @param show_help Запрошена справка (-h).
 */
struct InfoOptions {
  std::vector<std::string> files;
  std::string log_file;
  bool verbose = false;
  bool show_help = false;
};

/**
 * @brief Разбирает аргументы командной строки через getopt.
 * @param argc Количество аргументов.
 * @param argv Аргументы; argv[0] — имя программы.
 * @param out Заполняемые параметры.
 * @param error Описание ошибки при неудаче.
 * @return bool false при неизвестном ключе, ключе без значения или отсутствии файлов.
 * @warning getopt хранит состояние в глобальных переменных; функция сбрасывает optind перед разбором.
 */
bool ParseCommandLine(int argc, char* argv[], InfoOptions* out, std::string* error);

/// @brief Текст справки по использованию.
std::string UsageText(const std::string& program);

}  // namespace flyg::tools
