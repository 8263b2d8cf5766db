#ifndef PP_INDEXER_UTILITIES_H
#define PP_INDEXER_UTILITIES_H

#include <cstdint>
#include <string>
#include <vector>
#include "ResultOrError.hpp"
#include <nlohmann/json.hpp>

namespace ppi {

// Error type for utility functions and collaborator interfaces
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 * @return Current time in seconds
 */
int64_t getCurrentTime();

/**
 * Parse a 64-bit unsigned integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Split an absolute URL into its parts.
 * "https://api.devnet.solana.com" -> scheme "https", host, port 443, path "/"
 * @return true if the URL has a scheme and a host
 */
bool parseUrl(const std::string &url, std::string &scheme, std::string &host,
              uint16_t &port, std::string &path);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return parsed JSON, or error 1 (missing), 2 (unreadable), 3 (invalid JSON)
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Read optional members of a JSON configuration object.
 * The output is left untouched when the key is absent.
 * @return error 1 when the member has the wrong type
 */
Roe<void> readJsonField(const nlohmann::json &jd, const std::string &key, uint64_t &value);
Roe<void> readJsonField(const nlohmann::json &jd, const std::string &key, bool &value);
Roe<void> readJsonField(const nlohmann::json &jd, const std::string &key, std::string &value);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Hexadecimal string representation of the SHA-256 hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Same as sha256() but returns the 32 raw digest bytes
 */
std::string sha256Bytes(const std::string &input);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Base58 (Bitcoin alphabet) encoding, used for ledger public keys and
 * transaction signatures. Leading zero bytes map to leading '1's.
 */
std::string base58Encode(const std::string &data);

/**
 * Reverse of base58Encode
 * @return decoded bytes, or error 1 on a character outside the alphabet
 */
Roe<std::string> base58Decode(const std::string &text);

/**
 * Standard (padded) base64 encoding via Libsodium
 */
std::string base64Encode(const std::string &data);

/**
 * Decode standard base64 via Libsodium. Surrounding whitespace is ignored.
 * @return decoded bytes, or error 1 on malformed input
 */
Roe<std::string> base64Decode(const std::string &text);

/**
 * Write a string to a non-existent file
 * Creates parent directories if needed. Fails if the file already exists.
 * @param filePath Path to the file to write
 * @param content String content to write to the file
 * @return Roe<void> indicating success or error
 */
Roe<void> writeToNewFile(const std::string &filePath, const std::string &content);

} // namespace utl
} // namespace ppi

#endif // PP_INDEXER_UTILITIES_H
