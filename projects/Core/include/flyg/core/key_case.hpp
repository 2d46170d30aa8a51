#pragma once

#include <string>
#include <string_view>

namespace flyg::core {

/**
 * @brief Переводит имя поля из snake_case в lowerCamelCase.
 * @param name Внутреннее имя поля, например "fuel_capacity".
 * @return std::string Внешний ключ документа, например "fuelCapacity".
 * @note Подчёркивание в начале или в конце имени сохраняется как есть.
 */
std::string SnakeToLowerCamel(std::string_view name);

/**
 * @brief Обратное преобразование: lowerCamelCase в snake_case.
 * @param key Внешний ключ, например "numberOfEngines".
 * @return std::string Внутреннее имя, например "number_of_engines".
 */
std::string LowerCamelToSnake(std::string_view key);

}  // namespace flyg::core
