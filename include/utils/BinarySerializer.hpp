/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <cstring>
#include <format>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization into in-memory byte buffers.
 * Used for every message that crosses the node/authority boundary.
 * Values are written in host byte order; all supported targets are
 * little-endian.
 */
namespace BinarySerial {

using Buffer = std::vector<uint8_t>;

// Upper bounds that protect the reader from corrupt length prefixes
constexpr uint32_t MAX_STRING_LENGTH = 1024 * 1024;
constexpr uint32_t MAX_ELEMENT_COUNT = 1024 * 1024;

/**
 * Appends values to an owned buffer
 */
class Writer {
private:
  Buffer m_buffer;

public:
  Writer() { m_buffer.reserve(128); }

  // Write fundamental types
  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    const auto *bytes = reinterpret_cast<const uint8_t *>(&value);
    m_buffer.insert(m_buffer.end(), bytes, bytes + sizeof(T));
    return true;
  }

  // Write strings as u32 length + bytes
  bool writeString(const std::string &str) {
    if (str.size() > MAX_STRING_LENGTH) {
      SERIAL_ERROR(std::format("String length too large: {} bytes", str.size()));
      return false;
    }
    write(static_cast<uint32_t>(str.size()));
    m_buffer.insert(m_buffer.end(), str.begin(), str.end());
    return true;
  }

  // Write vectors of trivially copyable types
  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if (vec.size() > MAX_ELEMENT_COUNT) {
      SERIAL_ERROR(std::format("Vector size too large: {} elements", vec.size()));
      return false;
    }
    write(static_cast<uint32_t>(vec.size()));
    const auto *bytes = reinterpret_cast<const uint8_t *>(vec.data());
    m_buffer.insert(m_buffer.end(), bytes, bytes + sizeof(T) * vec.size());
    return true;
  }

  // Write custom serializable objects
  template <typename T> bool writeSerializable(const T &obj) {
    return obj.serialize(*this);
  }

  const Buffer &data() const { return m_buffer; }
  Buffer release() { return std::move(m_buffer); }
  size_t size() const { return m_buffer.size(); }
};

/**
 * Consumes values from a borrowed buffer. The buffer must outlive the reader.
 */
class Reader {
private:
  const uint8_t *m_data;
  size_t m_size;
  size_t m_offset{0};

public:
  explicit Reader(const Buffer &buffer)
      : m_data(buffer.data()), m_size(buffer.size()) {}
  Reader(const uint8_t *data, size_t size) : m_data(data), m_size(size) {
    if (data == nullptr && size != 0) {
      throw std::runtime_error("Invalid input buffer");
    }
  }

  // Read fundamental types
  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if (remaining() < sizeof(T)) {
      return false;
    }
    std::memcpy(&value, m_data + m_offset, sizeof(T));
    m_offset += sizeof(T);
    return true;
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }
    if (length > MAX_STRING_LENGTH) {
      SERIAL_ERROR(std::format("String length too large: {} bytes", length));
      return false;
    }
    if (remaining() < length) {
      return false;
    }
    str.assign(reinterpret_cast<const char *>(m_data + m_offset), length);
    m_offset += length;
    return true;
  }

  template <typename T> bool readVector(std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t count = 0;
    if (!read(count)) {
      return false;
    }
    if (count > MAX_ELEMENT_COUNT) {
      SERIAL_ERROR(std::format("Vector size too large: {} elements", count));
      return false;
    }
    const size_t bytes = sizeof(T) * static_cast<size_t>(count);
    if (remaining() < bytes) {
      return false;
    }
    vec.resize(count);
    if (bytes > 0) {
      std::memcpy(vec.data(), m_data + m_offset, bytes);
    }
    m_offset += bytes;
    return true;
  }

  // Read custom serializable objects
  template <typename T> bool readSerializable(T &obj) {
    return obj.deserialize(*this);
  }

  size_t remaining() const { return m_size - m_offset; }
  bool atEnd() const { return m_offset == m_size; }
};

/**
 * Convenience functions for whole-message encode/decode
 */
template <typename T> Buffer encode(const T &object) {
  Writer writer;
  if (!writer.writeSerializable(object)) {
    SERIAL_ERROR("Failed to encode object");
    return {};
  }
  return writer.release();
}

// Decoding fails unless the object consumes the buffer exactly
template <typename T> bool decode(const Buffer &buffer, T &object) {
  Reader reader(buffer);
  return reader.readSerializable(object) && reader.atEnd();
}

} // namespace BinarySerial

/**
 * Helper macros for serializable classes
 */
#define DECLARE_SERIALIZABLE()                                                 \
  bool serialize(BinarySerial::Writer &writer) const;                          \
  bool deserialize(BinarySerial::Reader &reader);

#define SERIALIZE_PRIMITIVE(writer, member)                                    \
  if (!writer.write(member))                                                   \
    return false;

#define DESERIALIZE_PRIMITIVE(reader, member)                                  \
  if (!reader.read(member))                                                    \
    return false;

#define SERIALIZE_STRING(writer, member)                                       \
  if (!writer.writeString(member))                                             \
    return false;

#define DESERIALIZE_STRING(reader, member)                                     \
  if (!reader.readString(member))                                              \
    return false;

#define SERIALIZE_SERIALIZABLE(writer, member)                                 \
  if (!writer.writeSerializable(member))                                       \
    return false;

#define DESERIALIZE_SERIALIZABLE(reader, member)                               \
  if (!reader.readSerializable(member))                                        \
    return false;

#endif // BINARY_SERIALIZER_HPP
