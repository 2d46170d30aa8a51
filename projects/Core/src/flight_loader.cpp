#include "flyg/core/flight_loader.hpp"

#include <c4/charconv.hpp>
#include <ryml.hpp>
#include <ryml_std.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "flyg/core/key_case.hpp"

#if defined(FLYG_WITH_COMPRESSION)
#include "flyg/core/gzip_reader.hpp"
#endif

namespace flyg::core {
namespace {

constexpr std::string_view kCompressedExtension = "gz";

// uint64 не переполняется на 19 десятичных цифрах.
constexpr std::size_t kMaxUnsignedDigits = 19;

/**
 * @brief Внешние ключи документа, выведенные из внутренних имён полей.
 * @note Строятся один раз через SnakeToLowerCamel при первом обращении.
 */
struct FieldKeys {
  std::string plane_information;
  std::string landing_speed;
  std::string times;
  std::string fuel_records;
  std::string name;
  std::string fuel_capacity;
  std::string number_of_engines;
  std::string fuel_weight;
  std::string unusable_fuel_quantity;
  std::string block_off_time;
  std::string takeoff_time;
  std::string landing_time;
  std::string block_on_time;
  std::string fuel_quantity;
};

const FieldKeys& Keys() {
  static const FieldKeys keys{
      SnakeToLowerCamel("plane_information"),
      SnakeToLowerCamel("landing_speed"),
      SnakeToLowerCamel("times"),
      SnakeToLowerCamel("fuel_records"),
      SnakeToLowerCamel("name"),
      SnakeToLowerCamel("fuel_capacity"),
      SnakeToLowerCamel("number_of_engines"),
      SnakeToLowerCamel("fuel_weight"),
      SnakeToLowerCamel("unusable_fuel_quantity"),
      SnakeToLowerCamel("block_off_time"),
      SnakeToLowerCamel("takeoff_time"),
      SnakeToLowerCamel("landing_time"),
      SnakeToLowerCamel("block_on_time"),
      SnakeToLowerCamel("fuel_quantity"),
  };
  return keys;
}

/**
 * @brief Обработчик ошибок rapidyaml: превращает ошибку разбора в исключение.
 * @note Передаётся парсеру и дереву конкретного вызова, глобальные callbacks не меняются.
 * @warning rapidyaml требует, чтобы обработчик не возвращал управление.
 */
[[noreturn]] void ThrowOnParseError(const char* msg,
                                    std::size_t msg_len,
                                    ryml::Location /*location*/,
                                    void* /*user_data*/) {
  throw std::runtime_error(std::string(msg, msg_len));
}

bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

/// @brief Пропускает цифры начиная с pos; возвращает их количество.
std::size_t SkipDigits(ryml::csubstr token, std::size_t* pos) {
  const std::size_t start = *pos;
  while (*pos < token.len && IsDigit(token.str[*pos])) {
    ++*pos;
  }
  return *pos - start;
}

/// @brief Целая часть числа JSON: "0" или цифры без ведущего нуля.
bool SkipJsonInteger(ryml::csubstr token, std::size_t* pos) {
  if (*pos < token.len && token.str[*pos] == '0') {
    ++*pos;
    return true;
  }
  return SkipDigits(token, pos) > 0;
}

/**
 * @brief Проверяет токен на грамматику числа JSON: -?int(.digits)?([eE][+-]?digits)?
 * @note c4::from_chars сам по себе принимает "+5", "0x38" и "0b111", поэтому проверка идёт до него.
 */
bool IsJsonNumber(ryml::csubstr token) {
  std::size_t pos = 0;
  if (pos < token.len && token.str[pos] == '-') {
    ++pos;
  }
  if (!SkipJsonInteger(token, &pos)) {
    return false;
  }
  if (pos < token.len && token.str[pos] == '.') {
    ++pos;
    if (SkipDigits(token, &pos) == 0) {
      return false;
    }
  }
  if (pos < token.len && (token.str[pos] == 'e' || token.str[pos] == 'E')) {
    ++pos;
    if (pos < token.len && (token.str[pos] == '+' || token.str[pos] == '-')) {
      ++pos;
    }
    if (SkipDigits(token, &pos) == 0) {
      return false;
    }
  }
  return pos == token.len;
}

/// @brief Неотрицательное целое JSON без дробной части и экспоненты.
bool IsJsonUnsignedInteger(ryml::csubstr token) {
  std::size_t pos = 0;
  return SkipJsonInteger(token, &pos) && pos == token.len;
}

/// @brief Все ключи карты различны; повторяющийся ключ делает документ невалидным.
bool HasUniqueKeys(ryml::ConstNodeRef node) {
  for (auto first = node.first_child(); first.readable(); first = first.next_sibling()) {
    for (auto second = first.next_sibling(); second.readable(); second = second.next_sibling()) {
      if (first.key() == second.key()) {
        return false;
      }
    }
  }
  return true;
}

bool IsJsonObject(ryml::ConstNodeRef node) {
  return node.readable() && node.is_map() && HasUniqueKeys(node);
}

ryml::ConstNodeRef FindField(ryml::ConstNodeRef parent, const std::string& key) {
  return parent.find_child(ryml::to_csubstr(key));
}

bool IsScalar(ryml::ConstNodeRef node) {
  return node.readable() && node.has_val() && !node.is_container();
}

/**
 * @brief Строка JSON: значение в двойных кавычках.
 * @note При разборе на месте значение начинается сразу после открывающей кавычки в буфере,
 *       так что одинарные кавычки YAML отличаются по предыдущему символу.
 */
bool IsDoubleQuoted(ryml::ConstNodeRef node) {
  if (!node.is_val_quoted()) {
    return false;
  }
  const auto value = node.val();
  return value.str != nullptr && value.str[-1] == '"';
}

bool ReadText(ryml::ConstNodeRef node, std::string* out) {
  if (!IsScalar(node) || !IsDoubleQuoted(node)) {
    return false;
  }
  const auto value = node.val();
  out->assign(value.str, value.len);
  return true;
}

bool ReadDecimal(ryml::ConstNodeRef node, double* out) {
  if (!IsScalar(node) || node.is_val_quoted()) {
    return false;
  }
  const auto value = node.val();
  if (!IsJsonNumber(value)) {
    return false;
  }
  double parsed{};
  if (!c4::from_chars(value, &parsed)) {
    return false;
  }
  *out = parsed;
  return true;
}

template <typename T>
bool ReadUnsigned(ryml::ConstNodeRef node, T* out) {
  if (!IsScalar(node) || node.is_val_quoted()) {
    return false;
  }
  const auto value = node.val();
  if (!IsJsonUnsignedInteger(value) || value.len > kMaxUnsignedDigits) {
    return false;
  }
  std::uint64_t parsed{};
  if (!c4::from_chars(value, &parsed)) {
    return false;
  }
  if (parsed > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
    return false;
  }
  *out = static_cast<T>(parsed);
  return true;
}

/// @brief Необязательное число: отсутствие ключа оставляет значение по умолчанию.
bool ReadOptionalDecimal(ryml::ConstNodeRef parent, const std::string& key, double* out) {
  const auto node = FindField(parent, key);
  if (!node.readable()) {
    return true;
  }
  return ReadDecimal(node, out);
}

bool ParsePlaneInformation(ryml::ConstNodeRef node, PlaneInformation* out) {
  if (!IsJsonObject(node)) {
    return false;
  }
  const auto& keys = Keys();
  if (!ReadText(FindField(node, keys.name), &out->name)) {
    return false;
  }
  if (!ReadUnsigned(FindField(node, keys.fuel_capacity), &out->fuel_capacity)) {
    return false;
  }
  if (!ReadUnsigned(FindField(node, keys.number_of_engines), &out->number_of_engines)) {
    return false;
  }
  if (!ReadOptionalDecimal(node, keys.fuel_weight, &out->fuel_weight)) {
    return false;
  }
  return ReadOptionalDecimal(node, keys.unusable_fuel_quantity, &out->unusable_fuel_quantity);
}

bool ParseTimes(ryml::ConstNodeRef node, Times* out) {
  if (!IsJsonObject(node)) {
    return false;
  }
  const auto& keys = Keys();
  return ReadText(FindField(node, keys.block_off_time), &out->block_off_time) &&
         ReadText(FindField(node, keys.takeoff_time), &out->takeoff_time) &&
         ReadText(FindField(node, keys.landing_time), &out->landing_time) &&
         ReadText(FindField(node, keys.block_on_time), &out->block_on_time);
}

bool ParseFuelRecords(ryml::ConstNodeRef node, std::vector<FuelRecord>* out) {
  out->clear();
  if (!node.readable()) {
    return true;
  }
  if (!node.is_seq()) {
    return false;
  }
  out->reserve(node.num_children());
  for (const auto child : node.children()) {
    if (!IsJsonObject(child)) {
      return false;
    }
    FuelRecord record{};
    if (!ReadDecimal(FindField(child, Keys().fuel_quantity), &record.fuel_quantity)) {
      return false;
    }
    out->push_back(record);
  }
  return true;
}

/// @brief Документ записи обязан быть объектом JSON: первый значащий символ "{".
bool StartsWithObject(const std::string& content) {
  const auto first = content.find_first_not_of(" \t\r\n");
  return first != std::string::npos && content[first] == '{';
}

bool ParseFlightDocument(std::string* content, FlightRecording* out) {
  if (!StartsWithObject(*content)) {
    return false;
  }

  const ryml::Callbacks callbacks(nullptr, nullptr, nullptr, &ThrowOnParseError);
  try {
    ryml::Parser parser(callbacks);
    ryml::Tree tree(callbacks);
    parser.parse_json_in_place(ryml::csubstr{}, ryml::substr(content->data(), content->size()),
                               &tree);

    const auto root = tree.rootref();
    if (!IsJsonObject(root)) {
      return false;
    }
    const auto& keys = Keys();
    if (!ParsePlaneInformation(FindField(root, keys.plane_information), &out->plane_information)) {
      return false;
    }
    if (!ReadDecimal(FindField(root, keys.landing_speed), &out->landing_speed)) {
      return false;
    }
    if (!ParseTimes(FindField(root, keys.times), &out->times)) {
      return false;
    }
    return ParseFuelRecords(FindField(root, keys.fuel_records), &out->fuel_records);
  } catch (const std::exception&) {
    return false;
  }
}

std::string ToLowerASCII(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

/**
 * @brief Читает содержимое файла, при необходимости распаковывая gzip.
 * @param path Путь, по расширению которого выбирается способ чтения.
 * @param stream Уже открытый файловый поток.
 * @param content Буфер под документ.
 * @return std::optional<FormatError> Ошибка чтения или распаковки.
 */
std::optional<FormatError> ReadContent([[maybe_unused]] const std::filesystem::path& path,
                                       std::istream& stream,
                                       std::string* content) {
#if defined(FLYG_WITH_COMPRESSION)
  if (IsCompressedFlightPath(path)) {
    if (!DecompressGzip(stream, content)) {
      return FormatError::kDecompressionFailed;
    }
    return std::nullopt;
  }
#endif

  content->assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
  if (stream.bad()) {
    return FormatError::kFileFormatNotRecognized;
  }
  return std::nullopt;
}

}  // namespace

bool IsCompressedFlightPath(const std::filesystem::path& path) {
  const std::string file_name = path.filename().string();
  const auto dot = file_name.find_last_of('.');
  if (dot == std::string::npos) {
    return false;
  }
  return ToLowerASCII(file_name.substr(dot + 1)) == kCompressedExtension;
}

bool CompressionSupported() {
#if defined(FLYG_WITH_COMPRESSION)
  return true;
#else
  return false;
#endif
}

FlightLoadResult LoadFlightInformationFromFile(const std::filesystem::path& path) {
  FlightLoadResult result{};

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    result.error = FormatError::kCouldNotOpenFile;
    return result;
  }

  std::ifstream stream(path, std::ios::binary);
  if (!stream.is_open()) {
    result.error = FormatError::kCouldNotOpenFile;
    return result;
  }

  std::string content;
  if (const auto read_error = ReadContent(path, stream, &content); read_error.has_value()) {
    result.error = read_error;
    return result;
  }

  FlightRecording recording{};
  if (!ParseFlightDocument(&content, &recording)) {
    result.error = FormatError::kFileFormatNotRecognized;
    return result;
  }

  result.recording = std::move(recording);
  return result;
}

}  // namespace flyg::core
