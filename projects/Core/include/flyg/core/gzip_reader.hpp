#pragma once

#include <istream>
#include <string>

namespace flyg::core {

/**
 * @brief Распаковывает один gzip-член из потока.
 * @param stream Поток с сжатыми данными, читается блоками.
 * @param out Буфер для распакованных данных; дополняется.
 * @return bool false, если zlib не инициализировался, данные повреждены или оборваны.
 * @note Данные после конца первого члена игнорируются.
 */
bool DecompressGzip(std::istream& stream, std::string* out);

}  // namespace flyg::core
