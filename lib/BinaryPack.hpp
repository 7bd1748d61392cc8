#ifndef LEDGERWATCH_BINARY_PACK_HPP
#define LEDGERWATCH_BINARY_PACK_HPP

#include "ResultOrError.hpp"
#include "Serialize.hpp"
#include <sstream>
#include <string>

namespace lw {
namespace utl {

struct BinaryUnpackError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

/**
 * Pack a struct/object to binary string using OutputArchive
 * @param t The object to serialize
 * @return Binary string representation
 */
template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

/**
 * Unpack a binary string to a struct/object using InputArchive.
 * Trailing bytes after the object are treated as an error.
 * @param data Binary string data
 * @return The deserialized object or an error
 */
template <typename T>
ResultOrError<T, BinaryUnpackError> binaryUnpack(const std::string &data) {
  std::istringstream iss(data, std::ios::binary);
  InputArchive ar(iss);
  T result{};
  ar &result;
  if (ar.failed()) {
    return BinaryUnpackError(1, "Failed to deserialize binary data");
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    return BinaryUnpackError(2, "Unexpected trailing data after object");
  }
  return result;
}

} // namespace utl
} // namespace lw

#endif // LEDGERWATCH_BINARY_PACK_HPP
