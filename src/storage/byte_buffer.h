/**
 * @file byte_buffer.h
 * @brief Little-endian byte writer/reader used by every segment codec
 *
 * All multi-byte integers in the container are little-endian regardless
 * of host byte order. Reads are bounds-checked: a read past the end puts
 * the reader into a failed state instead of touching memory.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace rvfstore::storage {

/**
 * @brief Append-only little-endian encoder
 */
class ByteWriter {
 public:
  ByteWriter() = default;
  explicit ByteWriter(std::string* out) : out_(out) {}

  void PutU8(uint8_t value) { Buffer().push_back(static_cast<char>(value)); }

  void PutU16(uint16_t value) { PutLE(value, 2); }
  void PutU32(uint32_t value) { PutLE(value, 4); }
  void PutU64(uint64_t value) { PutLE(value, 8); }

  void PutF32(float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    PutU32(bits);
  }

  void PutBytes(const void* data, size_t len) {
    Buffer().append(static_cast<const char*>(data), len);
  }

  /**
   * @brief u32 length prefix followed by the bytes
   */
  void PutString(const std::string& str) {
    PutU32(static_cast<uint32_t>(str.size()));
    PutBytes(str.data(), str.size());
  }

  void PutZeros(size_t count) { Buffer().append(count, '\0'); }

  [[nodiscard]] size_t size() const { return out_ != nullptr ? out_->size() : own_.size(); }
  [[nodiscard]] const std::string& data() const { return out_ != nullptr ? *out_ : own_; }
  std::string Take() { return std::move(own_); }

 private:
  std::string& Buffer() { return out_ != nullptr ? *out_ : own_; }

  void PutLE(uint64_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
      Buffer().push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
  }

  std::string own_;
  std::string* out_ = nullptr;
};

/**
 * @brief Bounds-checked little-endian decoder over a borrowed buffer
 *
 * Once any read fails, ok() stays false and every later read returns a
 * zero value. Callers check ok() at record boundaries.
 */
class ByteReader {
 public:
  ByteReader(const char* data, size_t size) : data_(data), size_(size) {}
  explicit ByteReader(const std::string& buf) : data_(buf.data()), size_(buf.size()) {}

  uint8_t GetU8() { return static_cast<uint8_t>(GetLE(1)); }
  uint16_t GetU16() { return static_cast<uint16_t>(GetLE(2)); }
  uint32_t GetU32() { return static_cast<uint32_t>(GetLE(4)); }
  uint64_t GetU64() { return GetLE(8); }

  float GetF32() {
    uint32_t bits = GetU32();
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  /**
   * @brief Read a u32 length-prefixed string
   *
   * Fails if the declared length exceeds the remaining bytes.
   */
  bool GetString(std::string& out) {
    uint32_t len = GetU32();
    if (!ok_ || len > remaining()) {
      ok_ = false;
      out.clear();
      return false;
    }
    out.assign(data_ + pos_, len);
    pos_ += len;
    return true;
  }

  bool GetBytes(void* out, size_t len) {
    if (!ok_ || len > remaining()) {
      ok_ = false;
      return false;
    }
    std::memcpy(out, data_ + pos_, len);
    pos_ += len;
    return true;
  }

  bool Skip(size_t len) {
    if (!ok_ || len > remaining()) {
      ok_ = false;
      return false;
    }
    pos_ += len;
    return true;
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] bool AtEnd() const { return pos_ == size_; }
  [[nodiscard]] size_t position() const { return pos_; }
  [[nodiscard]] size_t remaining() const { return size_ - pos_; }
  [[nodiscard]] const char* cursor() const { return data_ + pos_; }

 private:
  uint64_t GetLE(int bytes) {
    if (!ok_ || static_cast<size_t>(bytes) > remaining()) {
      ok_ = false;
      return 0;
    }
    uint64_t value = 0;
    for (int i = 0; i < bytes; ++i) {
      value |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_ + i])) << (8 * i);
    }
    pos_ += bytes;
    return value;
  }

  const char* data_;
  size_t size_;
  size_t pos_ = 0;
  bool ok_ = true;
};

}  // namespace rvfstore::storage
