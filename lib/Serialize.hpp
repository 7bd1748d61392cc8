#ifndef LEDGERWATCH_SERIALIZE_HPP
#define LEDGERWATCH_SERIALIZE_HPP

#include <cstdint>
#include <cstring>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace lw {

namespace detail {

// Fixed-width integers are written big endian (network byte order)
template <typename U> inline void writeBigEndian(std::ostream &os, U value) {
  static_assert(std::is_unsigned_v<U>, "writeBigEndian requires unsigned type");
  char bytes[sizeof(U)];
  for (size_t i = 0; i < sizeof(U); ++i) {
    bytes[sizeof(U) - 1 - i] = static_cast<char>(value & 0xFF);
    value = static_cast<U>(value >> 8);
  }
  os.write(bytes, sizeof(U));
}

template <typename U> inline bool readBigEndian(std::istream &is, U &value) {
  static_assert(std::is_unsigned_v<U>, "readBigEndian requires unsigned type");
  unsigned char bytes[sizeof(U)];
  if (!is.read(reinterpret_cast<char *>(bytes), sizeof(U))) {
    return false;
  }
  U result = 0;
  for (size_t i = 0; i < sizeof(U); ++i) {
    result = static_cast<U>((result << 8) | bytes[i]);
  }
  value = result;
  return true;
}

template <typename T, typename Archive, typename = void>
struct has_serialize : std::false_type {};

template <typename T, typename Archive>
struct has_serialize<T, Archive,
                     std::void_t<decltype(std::declval<T &>().serialize(
                         std::declval<Archive &>()))>> : std::true_type {};

} // namespace detail

/**
 * OutputArchive for serialization (writing)
 * Supports the & operator pattern used by custom structs
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & myValue;
 *   std::string data = oss.str();
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  OutputArchive &operator&(bool value) {
    uint8_t byte = value ? 1 : 0;
    detail::writeBigEndian(os_, byte);
    return *this;
  }

  // Integers of any width and signedness
  template <typename T>
  std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                   OutputArchive &>
  operator&(T value) {
    using U = std::make_unsigned_t<T>;
    detail::writeBigEndian(os_, static_cast<U>(value));
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    detail::writeBigEndian(os_, static_cast<uint64_t>(value.size()));
    if (!value.empty()) {
      os_.write(value.data(), static_cast<std::streamsize>(value.size()));
    }
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    detail::writeBigEndian(os_, static_cast<uint64_t>(value.size()));
    for (const auto &item : value) {
      (*this) & item;
    }
    return *this;
  }

  template <typename K, typename V>
  OutputArchive &operator&(const std::map<K, V> &value) {
    detail::writeBigEndian(os_, static_cast<uint64_t>(value.size()));
    for (const auto &pair : value) {
      (*this) & pair.first;
      (*this) & pair.second;
    }
    return *this;
  }

  // Custom types providing template <typename Archive> void serialize(Archive&).
  // serialize() is non-const but only reads when writing.
  template <typename T>
  std::enable_if_t<detail::has_serialize<T, OutputArchive>::value,
                   OutputArchive &>
  operator&(const T &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    const_cast<T &>(value).serialize(*this);
    return *this;
  }

private:
  std::ostream &os_;
};

/**
 * InputArchive for deserialization (reading)
 *
 * Usage:
 *   std::istringstream iss(data);
 *   InputArchive ar(iss);
 *   ar & myValue;
 *   if (ar.failed()) { handle error }
 */
class InputArchive {
public:
  // Upper bound for a single string or container read from untrusted input
  static constexpr uint64_t MAX_ELEMENTS = 64ULL * 1024 * 1024;

  explicit InputArchive(std::istream &is) : is_(is) {}

  bool failed() const { return failed_; }

  InputArchive &operator&(bool &value) {
    uint8_t byte = 0;
    if (!failed_ && detail::readBigEndian(is_, byte)) {
      value = (byte != 0);
    } else {
      failed_ = true;
    }
    return *this;
  }

  template <typename T>
  std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                   InputArchive &>
  operator&(T &value) {
    using U = std::make_unsigned_t<T>;
    U raw = 0;
    if (!failed_ && detail::readBigEndian(is_, raw)) {
      value = static_cast<T>(raw);
    } else {
      failed_ = true;
    }
    return *this;
  }

  InputArchive &operator&(std::string &value) {
    uint64_t size = 0;
    if (!readSize(size)) {
      return *this;
    }
    value.resize(static_cast<size_t>(size));
    if (size > 0 &&
        !is_.read(&value[0], static_cast<std::streamsize>(size))) {
      failed_ = true;
    }
    return *this;
  }

  template <typename T> InputArchive &operator&(std::vector<T> &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    uint64_t size = 0;
    if (!readSize(size)) {
      return *this;
    }
    value.clear();
    for (uint64_t i = 0; i < size && !failed_; ++i) {
      T item{};
      (*this) & item;
      value.push_back(std::move(item));
    }
    return *this;
  }

  template <typename K, typename V>
  InputArchive &operator&(std::map<K, V> &value) {
    uint64_t size = 0;
    if (!readSize(size)) {
      return *this;
    }
    value.clear();
    for (uint64_t i = 0; i < size && !failed_; ++i) {
      K key{};
      V item{};
      (*this) & key;
      (*this) & item;
      value.emplace(std::move(key), std::move(item));
    }
    return *this;
  }

  template <typename T>
  std::enable_if_t<detail::has_serialize<T, InputArchive>::value,
                   InputArchive &>
  operator&(T &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    if (!failed_) {
      value.serialize(*this);
    }
    return *this;
  }

private:
  bool readSize(uint64_t &size) {
    if (failed_ || !detail::readBigEndian(is_, size) || size > MAX_ELEMENTS) {
      failed_ = true;
      return false;
    }
    return true;
  }

  std::istream &is_;
  bool failed_{ false };
};

} // namespace lw

#endif // LEDGERWATCH_SERIALIZE_HPP
