#ifndef PP_INDEXER_BYTE_READER_H
#define PP_INDEXER_BYTE_READER_H

#include <cstdint>
#include <optional>
#include <string>

namespace ppi {

/**
 * Random-access little-endian reader over an event payload.
 *
 * Every read is bounds-checked against the payload and yields std::nullopt
 * instead of touching bytes past the end, so a short payload can be probed
 * field by field without special casing.
 */
class ByteReader {
public:
  explicit ByteReader(const std::string &data) : data_(data) {}

  size_t size() const { return data_.size(); }

  bool fits(size_t offset, size_t length) const {
    return offset <= data_.size() && length <= data_.size() - offset;
  }

  std::optional<std::string> readBytes(size_t offset, size_t length) const {
    if (!fits(offset, length)) {
      return std::nullopt;
    }
    return data_.substr(offset, length);
  }

  std::optional<uint8_t> readU8(size_t offset) const { return readLe<uint8_t>(offset); }
  std::optional<uint16_t> readU16(size_t offset) const { return readLe<uint16_t>(offset); }
  std::optional<uint32_t> readU32(size_t offset) const { return readLe<uint32_t>(offset); }
  std::optional<uint64_t> readU64(size_t offset) const { return readLe<uint64_t>(offset); }

  std::optional<int64_t> readI64(size_t offset) const {
    auto raw = readLe<uint64_t>(offset);
    if (!raw) {
      return std::nullopt;
    }
    return static_cast<int64_t>(*raw);
  }

private:
  template <typename T> std::optional<T> readLe(size_t offset) const {
    if (!fits(offset, sizeof(T))) {
      return std::nullopt;
    }
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<T>(static_cast<T>(static_cast<uint8_t>(data_[offset + i])) << (8 * i));
    }
    return value;
  }

  const std::string &data_;
};

} // namespace ppi

#endif // PP_INDEXER_BYTE_READER_H
