#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Thin OpenSSL wrappers shared by the obfuscation strategies and the vault.
namespace CryptoUtil {

std::string to_hex(const unsigned char* data, std::size_t len, bool upper);

// Lowercase hex digests.
std::string sha256_hex(const std::string& data);
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// Returns false if the CSPRNG failed.
bool random_bytes(unsigned char* out, std::size_t len);
// Uppercase hex of random bytes, n_chars long ("" if the CSPRNG failed).
std::string random_hex(std::size_t n_chars);

std::string base64_encode(const std::vector<std::uint8_t>& data);
// Strict standard alphabet with padding; false on malformed input.
bool base64_decode(const std::string& in, std::vector<std::uint8_t>& out);

} // namespace CryptoUtil
