#ifndef LEDGERWATCH_UTILITIES_H
#define LEDGERWATCH_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lw {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 * @return Current time in milliseconds
 */
int64_t getCurrentTimeMs();

/**
 * Parse an integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a port number from a string (validates range 0-65535)
 * @param str String to parse
 * @param port Output parameter for the parsed port
 * @return true if parsing succeeded and port is in valid range, false otherwise
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components
 * @param hostPort String in format "host:port"
 * @param host Output parameter for the host part
 * @param port Output parameter for the port part
 * @return true if parsing succeeded, false otherwise
 */
bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return The parsed JSON object or an error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Compute SHA-256 hash using libsodium
 * @param input Input string to hash
 * @return Lowercase hexadecimal representation of the hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Return a string safe for JSON (UTF-8). If input contains non-printable or
 * non-ASCII bytes, returns "0x" + hexEncode(input).
 */
std::string toJsonSafeString(const std::string &s);

} // namespace utl
} // namespace lw

#endif // LEDGERWATCH_UTILITIES_H
