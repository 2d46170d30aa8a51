#include "flyg/core/format_error.hpp"

namespace flyg::core {

std::string_view ToString(FormatError error) {
  switch (error) {
    case FormatError::kCouldNotOpenFile:
      return "Could not open supplied file";
    case FormatError::kFileFormatNotRecognized:
      return "Content of supplied file is not recognized";
    case FormatError::kDecompressionFailed:
      return "Decompression of supplied file failed";
  }
  return "Unknown flight file error";
}

}  // namespace flyg::core
