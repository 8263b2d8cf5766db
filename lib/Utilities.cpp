#include "Utilities.h"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ppi {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
  struct SodiumInitializer {
    SodiumInitializer() {
      if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
      }
    }
  };
  static SodiumInitializer sodium_initializer;

  const char BASE58_ALPHABET[] =
      "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseUrl(const std::string &url, std::string &scheme, std::string &host,
              uint16_t &port, std::string &path) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0) {
    return false;
  }
  scheme = url.substr(0, schemeEnd);

  std::string rest = url.substr(schemeEnd + 3);
  auto pathStart = rest.find('/');
  std::string authority = rest.substr(0, pathStart);
  path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);

  if (scheme == "https" || scheme == "wss") {
    port = 443;
  } else if (scheme == "http" || scheme == "ws") {
    port = 80;
  } else {
    return false;
  }

  auto colonPos = authority.find_last_of(':');
  if (colonPos != std::string::npos) {
    uint64_t parsed = 0;
    if (!parseUInt64(authority.substr(colonPos + 1), parsed) || parsed == 0 ||
        parsed > 65535) {
      return false;
    }
    port = static_cast<uint16_t>(parsed);
    authority = authority.substr(0, colonPos);
  }

  host = authority;
  return !host.empty();
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

Roe<void> readJsonField(const nlohmann::json &jd, const std::string &key, uint64_t &value) {
  if (!jd.contains(key)) {
    return {};
  }
  const auto &field = jd[key];
  if (!field.is_number_integer() || (!field.is_number_unsigned() && field.get<int64_t>() < 0)) {
    return Error(1, "Field '" + key + "' must be a non-negative integer");
  }
  value = field.get<uint64_t>();
  return {};
}

Roe<void> readJsonField(const nlohmann::json &jd, const std::string &key, bool &value) {
  if (!jd.contains(key)) {
    return {};
  }
  if (!jd[key].is_boolean()) {
    return Error(1, "Field '" + key + "' must be a boolean");
  }
  value = jd[key].get<bool>();
  return {};
}

Roe<void> readJsonField(const nlohmann::json &jd, const std::string &key, std::string &value) {
  if (!jd.contains(key)) {
    return {};
  }
  if (!jd[key].is_string()) {
    return Error(1, "Field '" + key + "' must be a string");
  }
  value = jd[key].get<std::string>();
  return {};
}

std::string sha256Bytes(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char*>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return std::string(reinterpret_cast<const char*>(hash), sizeof(hash));
}

std::string sha256(const std::string &input) {
  return hexEncode(sha256Bytes(input));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = 0, lo = 0;
    char c1 = hex[i], c2 = hex[i + 1];
    if (c1 >= '0' && c1 <= '9') hi = c1 - '0';
    else if (c1 >= 'a' && c1 <= 'f') hi = c1 - 'a' + 10;
    else if (c1 >= 'A' && c1 <= 'F') hi = c1 - 'A' + 10;
    else return {};
    if (c2 >= '0' && c2 <= '9') lo = c2 - '0';
    else if (c2 >= 'a' && c2 <= 'f') lo = c2 - 'a' + 10;
    else if (c2 >= 'A' && c2 <= 'F') lo = c2 - 'A' + 10;
    else return {};
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string base58Encode(const std::string &data) {
  size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == '\0') {
    ++zeros;
  }

  // log(256) / log(58) ~ 1.37
  std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
  size_t length = 0;
  for (size_t i = zeros; i < data.size(); ++i) {
    uint32_t carry = static_cast<uint8_t>(data[i]);
    size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
         ++it, ++j) {
      carry += 256u * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = digits.begin() + (digits.size() - length);
  while (it != digits.end() && *it == 0) {
    ++it;
  }

  std::string out(zeros, '1');
  for (; it != digits.end(); ++it) {
    out.push_back(BASE58_ALPHABET[*it]);
  }
  return out;
}

Roe<std::string> base58Decode(const std::string &text) {
  size_t ones = 0;
  while (ones < text.size() && text[ones] == '1') {
    ++ones;
  }

  // log(58) / log(256) ~ 0.733
  std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
  size_t length = 0;
  for (size_t i = ones; i < text.size(); ++i) {
    const char *p = std::char_traits<char>::find(BASE58_ALPHABET, 58, text[i]);
    if (p == nullptr) {
      return Error(1, "Invalid base58 character at position " + std::to_string(i));
    }
    uint32_t carry = static_cast<uint32_t>(p - BASE58_ALPHABET);
    size_t j = 0;
    for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend();
         ++it, ++j) {
      carry += 58u * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = bytes.begin() + (bytes.size() - length);
  while (it != bytes.end() && *it == 0) {
    ++it;
  }

  std::string out(ones, '\0');
  out.append(it, bytes.end());
  return out;
}

std::string base64Encode(const std::string &data) {
  const size_t encodedLen =
      sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
  std::string out(encodedLen, '\0');
  sodium_bin2base64(out.data(), out.size(),
                    reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                    sodium_base64_VARIANT_ORIGINAL);
  // Drop the terminating NUL written by libsodium
  out.resize(encodedLen - 1);
  return out;
}

Roe<std::string> base64Decode(const std::string &text) {
  size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return std::string();
  }
  size_t end = text.find_last_not_of(" \t\r\n") + 1;
  const char *b64 = text.data() + begin;
  const size_t b64Len = end - begin;

  std::string out(b64Len / 4 * 3 + 3, '\0');
  size_t binLen = 0;
  const char *b64End = nullptr;
  if (sodium_base642bin(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                        b64, b64Len, nullptr, &binLen, &b64End,
                        sodium_base64_VARIANT_ORIGINAL) != 0) {
    return Error(1, "Malformed base64 input");
  }
  if (b64End != b64 + b64Len) {
    return Error(1, "Trailing characters after base64 input");
  }
  out.resize(binLen);
  return out;
}

Roe<void> writeToNewFile(const std::string &filePath, const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath + ": " + ec.message());
    }
  }

  std::ofstream file(filePath);
  if (!file.is_open()) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }

  file << content;
  file.close();

  if (!file.good()) {
    return Error(4, "Failed to write content to file: " + filePath);
  }

  return {};
}

} // namespace utl
} // namespace ppi
