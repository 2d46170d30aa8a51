#include "flyg/core/flight_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#if defined(FLYG_WITH_COMPRESSION)
#include "gzip_fixture.hpp"
#endif

namespace {

using flyg::core::FormatError;
using flyg::core::LoadFlightInformationFromFile;

std::filesystem::path DataFile(const std::string& name) {
  return std::filesystem::current_path() / "test_data" / name;
}

void ExpectError(const std::string& name, FormatError expected) {
  const auto result = LoadFlightInformationFromFile(DataFile(name));
  ASSERT_FALSE(result.success()) << name;
  EXPECT_EQ(*result.error, expected) << name << ": " << flyg::core::ToString(*result.error);
}

/**
 * @brief Проверяет полную загрузку записи расширенной схемы из несжатого файла.
 * @note Каждое поле сверяется с test_data/uncompressed.flyg.
 */
TEST(FlightLoaderTest, LoadsUncompressedRecording) {
  const auto result = LoadFlightInformationFromFile(DataFile("uncompressed.flyg"));
  ASSERT_TRUE(result.success()) << flyg::core::ToString(*result.error);

  const auto& recording = result.recording;
  EXPECT_EQ(recording.plane_information.name, "Cessna 172 Skyhawk");
  EXPECT_EQ(recording.plane_information.fuel_capacity, 56u);
  EXPECT_EQ(recording.plane_information.number_of_engines, 1u);
  EXPECT_DOUBLE_EQ(recording.plane_information.fuel_weight, 6.0);
  EXPECT_DOUBLE_EQ(recording.plane_information.unusable_fuel_quantity, 3.5);
  EXPECT_DOUBLE_EQ(recording.landing_speed, 4.25);
  EXPECT_EQ(recording.times.block_off_time, "2026-05-02T09:12:00Z");
  EXPECT_EQ(recording.times.takeoff_time, "2026-05-02T09:21:30Z");
  EXPECT_EQ(recording.times.landing_time, "2026-05-02T10:47:10Z");
  EXPECT_EQ(recording.times.block_on_time, "2026-05-02T10:55:45Z");
  ASSERT_EQ(recording.fuel_records.size(), 3u);
  EXPECT_DOUBLE_EQ(recording.fuel_records[0].fuel_quantity, 53.0);
  EXPECT_DOUBLE_EQ(recording.fuel_records[1].fuel_quantity, 48.5);
  EXPECT_DOUBLE_EQ(recording.fuel_records[2].fuel_quantity, 41.25);
}

/**
 * @brief Запись базовой схемы: расширенные поля получают значения по умолчанию.
 */
TEST(FlightLoaderTest, LoadsBaseSchemaWithDefaults) {
  const auto result = LoadFlightInformationFromFile(DataFile("base_schema.flyg"));
  ASSERT_TRUE(result.success()) << flyg::core::ToString(*result.error);

  const auto& recording = result.recording;
  EXPECT_EQ(recording.plane_information.name, "Beechcraft Baron 58");
  EXPECT_EQ(recording.plane_information.fuel_capacity, 194u);
  EXPECT_EQ(recording.plane_information.number_of_engines, 2u);
  EXPECT_DOUBLE_EQ(recording.plane_information.fuel_weight, 0.0);
  EXPECT_DOUBLE_EQ(recording.plane_information.unusable_fuel_quantity, 0.0);
  EXPECT_DOUBLE_EQ(recording.landing_speed, 6.5);
  EXPECT_EQ(recording.times.block_on_time, "09:12:00");
  EXPECT_TRUE(recording.fuel_records.empty());
}

TEST(FlightLoaderTest, ReportsMissingFile) {
  ExpectError("this_file_does_not_exist.flyg", FormatError::kCouldNotOpenFile);
}

TEST(FlightLoaderTest, ReportsDirectoryAsUnopenable) {
  const auto result = LoadFlightInformationFromFile(std::filesystem::current_path() / "test_data");
  ASSERT_FALSE(result.success());
  EXPECT_EQ(*result.error, FormatError::kCouldNotOpenFile);
}

/**
 * @brief Файлы, не являющиеся корректной записью полёта, отклоняются одним видом ошибки.
 * @note Покрывает пустой файл, оборванный документ, неверную форму корня и ошибки типов.
 */
TEST(FlightLoaderTest, ReportsUnrecognizedContent) {
  ExpectError("empty.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("truncated.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("wrong_shape.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("missing_landing_speed.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("wrong_type.flyg", FormatError::kFileFormatNotRecognized);
}

/**
 * @brief Ключи документа обязаны быть в lowerCamelCase: snake_case-ключи не распознаются.
 */
TEST(FlightLoaderTest, RequiresLowerCamelCaseKeys) {
  ExpectError("snake_case_keys.flyg", FormatError::kFileFormatNotRecognized);
}

/**
 * @brief Документ обязан быть JSON: YAML-разметка, шестнадцатеричные числа,
 *        знак "+", одинарные кавычки и повторяющиеся ключи отклоняются.
 */
TEST(FlightLoaderTest, RejectsDocumentsThatAreNotJson) {
  ExpectError("yaml_block.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("hex_integer.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("plus_sign_decimal.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("single_quoted_name.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("duplicate_key.flyg", FormatError::kFileFormatNotRecognized);
}

/**
 * @brief Целые поля принимают только неотрицательные целые в пределах своего типа.
 */
TEST(FlightLoaderTest, RejectsInvalidIntegerFields) {
  ExpectError("negative_capacity.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("fractional_capacity.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("capacity_out_of_range.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("engines_out_of_range.flyg", FormatError::kFileFormatNotRecognized);
}

TEST(FlightLoaderTest, AcceptsIntegerLimitsAndExponentDecimals) {
  const auto result = LoadFlightInformationFromFile(DataFile("capacity_at_limit.flyg"));
  ASSERT_TRUE(result.success()) << flyg::core::ToString(*result.error);
  EXPECT_EQ(result.recording.plane_information.fuel_capacity, 4294967295u);
  EXPECT_EQ(result.recording.plane_information.number_of_engines, 255u);
  EXPECT_DOUBLE_EQ(result.recording.plane_information.fuel_weight, -0.15);
}

/**
 * @brief Неверный тип поля отклоняется, в том числе у необязательных полей расширенной схемы.
 */
TEST(FlightLoaderTest, RejectsMistypedFields) {
  ExpectError("numeric_name.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("quoted_fuel_weight.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("fuel_records_not_sequence.flyg", FormatError::kFileFormatNotRecognized);
  ExpectError("fuel_record_without_quantity.flyg", FormatError::kFileFormatNotRecognized);
}

/**
 * @brief Параллельные загрузки не влияют друг на друга.
 * @note Каждый поток чередует корректный и оборванный файл; ошибка разбора одного
 *       вызова не должна портить результат соседнего.
 */
TEST(FlightLoaderTest, ConcurrentLoadsAreIndependent) {
  constexpr int kThreads = 8;
  constexpr int kIterations = 25;
  const auto good_path = DataFile("uncompressed.flyg");
  const auto bad_path = DataFile("truncated.flyg");

  std::vector<int> mismatches(kThreads, 0);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kIterations; ++i) {
        const bool load_good = (i + t) % 2 == 0;
        const auto result = LoadFlightInformationFromFile(load_good ? good_path : bad_path);
        if (load_good) {
          if (!result.success() || result.recording.fuel_records.size() != 3u ||
              result.recording.plane_information.name != "Cessna 172 Skyhawk") {
            ++mismatches[t];
          }
        } else if (result.success() || *result.error != FormatError::kFileFormatNotRecognized) {
          ++mismatches[t];
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  for (int t = 0; t < kThreads; ++t) {
    EXPECT_EQ(mismatches[t], 0) << "thread " << t;
  }
}

TEST(FlightLoaderTest, DispatchesOnExtensionCaseInsensitively) {
  EXPECT_TRUE(flyg::core::IsCompressedFlightPath("flight.gz"));
  EXPECT_TRUE(flyg::core::IsCompressedFlightPath("flight.GZ"));
  EXPECT_TRUE(flyg::core::IsCompressedFlightPath("logs/flight.flyg.Gz"));
  EXPECT_TRUE(flyg::core::IsCompressedFlightPath(".gz"));
  EXPECT_FALSE(flyg::core::IsCompressedFlightPath("flight.flyg"));
  EXPECT_FALSE(flyg::core::IsCompressedFlightPath("flight.tgz"));
  EXPECT_FALSE(flyg::core::IsCompressedFlightPath("gz"));
  EXPECT_FALSE(flyg::core::IsCompressedFlightPath("archive.gz/flight"));
}

TEST(FormatErrorTest, HasDistinctMessages) {
  EXPECT_EQ(flyg::core::ToString(FormatError::kCouldNotOpenFile), "Could not open supplied file");
  EXPECT_EQ(flyg::core::ToString(FormatError::kFileFormatNotRecognized),
            "Content of supplied file is not recognized");
  EXPECT_EQ(flyg::core::ToString(FormatError::kDecompressionFailed),
            "Decompression of supplied file failed");
}

#if defined(FLYG_WITH_COMPRESSION)

TEST(FlightLoaderTest, ReportsCompressionSupport) {
  EXPECT_TRUE(flyg::core::CompressionSupported());
}

/**
 * @brief Сжимает известный документ и проверяет, что все поля читаются без изменений.
 * @note Расширение записывается в разных регистрах, чтобы проверить выбор ветки gzip.
 */
TEST(FlightLoaderTest, LoadsCompressedRecordingInAnyCase) {
  flyg::test::ScratchDir dir("loader_gzip");
  const std::string document = flyg::test::ReadTextFile(DataFile("uncompressed.flyg"));
  ASSERT_FALSE(document.empty());

  for (const std::string name : {"flight.gz", "flight.GZ", "flight.flyg.gZ"}) {
    const auto path = dir.path() / name;
    ASSERT_TRUE(flyg::test::WriteGzipFile(path, document));

    const auto result = LoadFlightInformationFromFile(path);
    ASSERT_TRUE(result.success()) << name << ": " << flyg::core::ToString(*result.error);
    const auto& recording = result.recording;
    EXPECT_EQ(recording.plane_information.name, "Cessna 172 Skyhawk") << name;
    EXPECT_EQ(recording.plane_information.fuel_capacity, 56u);
    EXPECT_EQ(recording.plane_information.number_of_engines, 1u);
    EXPECT_DOUBLE_EQ(recording.plane_information.fuel_weight, 6.0);
    EXPECT_DOUBLE_EQ(recording.plane_information.unusable_fuel_quantity, 3.5);
    EXPECT_DOUBLE_EQ(recording.landing_speed, 4.25);
    EXPECT_EQ(recording.times.takeoff_time, "2026-05-02T09:21:30Z");
    EXPECT_EQ(recording.times.landing_time, "2026-05-02T10:47:10Z");
    ASSERT_EQ(recording.fuel_records.size(), 3u);
    EXPECT_DOUBLE_EQ(recording.fuel_records[2].fuel_quantity, 41.25);
  }
}

TEST(FlightLoaderTest, ReportsDecompressionFailureForPlainTextGz) {
  ExpectError("not_gzip.gz", FormatError::kDecompressionFailed);
}

TEST(FlightLoaderTest, ReportsDecompressionFailureForTruncatedGzip) {
  flyg::test::ScratchDir dir("loader_truncated");
  const auto path = dir.path() / "flight.gz";
  ASSERT_TRUE(flyg::test::WriteGzipFile(path, flyg::test::ReadTextFile(DataFile("uncompressed.flyg"))));
  const auto size = std::filesystem::file_size(path);
  std::filesystem::resize_file(path, size / 2);

  const auto result = LoadFlightInformationFromFile(path);
  ASSERT_FALSE(result.success());
  EXPECT_EQ(*result.error, FormatError::kDecompressionFailed);
}

TEST(FlightLoaderTest, ReportsUnrecognizedContentInsideValidGzip) {
  flyg::test::ScratchDir dir("loader_gzip_bad_doc");
  const auto path = dir.path() / "flight.gz";
  ASSERT_TRUE(flyg::test::WriteGzipFile(path, "[1, 2, 3]"));

  const auto result = LoadFlightInformationFromFile(path);
  ASSERT_FALSE(result.success());
  EXPECT_EQ(*result.error, FormatError::kFileFormatNotRecognized);
}

/**
 * @brief Gzip без расширения "gz" не распознаётся по содержимому.
 * @warning Ожидается именно kFileFormatNotRecognized, а не kDecompressionFailed.
 */
TEST(FlightLoaderTest, DoesNotSniffGzipWithoutReservedExtension) {
  flyg::test::ScratchDir dir("loader_renamed");
  const auto path = dir.path() / "flight.flyg";
  ASSERT_TRUE(flyg::test::WriteGzipFile(path, flyg::test::ReadTextFile(DataFile("uncompressed.flyg"))));

  const auto result = LoadFlightInformationFromFile(path);
  ASSERT_FALSE(result.success());
  EXPECT_EQ(*result.error, FormatError::kFileFormatNotRecognized);
}

#else

TEST(FlightLoaderTest, ReportsCompressionSupport) {
  EXPECT_FALSE(flyg::core::CompressionSupported());
}

/**
 * @brief Без поддержки сжатия файл ".gz" читается как обычный документ.
 */
TEST(FlightLoaderTest, ReadsGzExtensionDirectlyWithoutCompression) {
  const auto result = LoadFlightInformationFromFile(DataFile("not_gzip.gz"));
  ASSERT_TRUE(result.success()) << flyg::core::ToString(*result.error);
  EXPECT_EQ(result.recording.plane_information.name, "Beechcraft Baron 58");
}

#endif

}  // namespace
