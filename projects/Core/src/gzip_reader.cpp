#include "flyg/core/gzip_reader.hpp"

#include <zlib.h>

#include <cstddef>
#include <vector>

namespace flyg::core {
namespace {

constexpr std::size_t kChunkSize = 16 * 1024;
// 15 бит окна + 16: zlib ожидает gzip-заголовок, а не zlib-обёртку.
constexpr int kGzipWindowBits = 15 + 16;

/// @brief Владеет z_stream и вызывает inflateEnd на любом пути выхода.
class InflateStream {
 public:
  InflateStream() { initialized_ = inflateInit2(&stream_, kGzipWindowBits) == Z_OK; }
  ~InflateStream() {
    if (initialized_) {
      inflateEnd(&stream_);
    }
  }

  InflateStream(const InflateStream&) = delete;
  InflateStream& operator=(const InflateStream&) = delete;

  [[nodiscard]] bool initialized() const { return initialized_; }
  z_stream* get() { return &stream_; }

 private:
  z_stream stream_{};
  bool initialized_ = false;
};

bool IsFatalInflateStatus(int status) {
  return status == Z_NEED_DICT || status == Z_DATA_ERROR || status == Z_MEM_ERROR ||
         status == Z_STREAM_ERROR;
}

}  // namespace

bool DecompressGzip(std::istream& stream, std::string* out) {
  InflateStream inflater;
  if (!inflater.initialized()) {
    return false;
  }
  z_stream* strm = inflater.get();

  std::vector<char> in_buffer(kChunkSize);
  std::vector<char> out_buffer(kChunkSize);
  int status = Z_OK;
  while (status != Z_STREAM_END) {
    stream.read(in_buffer.data(), static_cast<std::streamsize>(in_buffer.size()));
    const auto read = stream.gcount();
    if (stream.bad() || read <= 0) {
      // Поток закончился раньше, чем gzip-член.
      return false;
    }

    strm->next_in = reinterpret_cast<Bytef*>(in_buffer.data());
    strm->avail_in = static_cast<uInt>(read);
    do {
      strm->next_out = reinterpret_cast<Bytef*>(out_buffer.data());
      strm->avail_out = static_cast<uInt>(out_buffer.size());
      status = inflate(strm, Z_NO_FLUSH);
      if (IsFatalInflateStatus(status)) {
        return false;
      }
      out->append(out_buffer.data(), out_buffer.size() - strm->avail_out);
    } while (strm->avail_out == 0 && status != Z_STREAM_END);
  }
  return true;
}

}  // namespace flyg::core
