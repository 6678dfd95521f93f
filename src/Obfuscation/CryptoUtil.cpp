#include "CryptoUtil.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <utility>

namespace CryptoUtil {

std::string to_hex(const unsigned char* data, std::size_t len, bool upper) {
    const char* hex = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string h(len * 2, '0');
    for (std::size_t i = 0; i < len; i++) {
        h[2*i]   = hex[(data[i]>>4) & 0xF];
        h[2*i+1] = hex[data[i] & 0xF];
    }
    return h;
}

std::string sha256_hex(const std::string& data) {
    unsigned char out[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out);
    return to_hex(out, sizeof(out), false);
}

// Desc: HMAC-SHA256 keyed digest
// In: const std::string& key, const std::string& data
// Out: std::string (64 lowercase hex chars, "" on OpenSSL failure)
std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    const unsigned char* r = HMAC(EVP_sha256(),
                                  key.data(), static_cast<int>(key.size()),
                                  reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                  out, &out_len);
    if (!r) return {};
    return to_hex(out, out_len, false);
}

bool random_bytes(unsigned char* out, std::size_t len) {
    return RAND_bytes(out, static_cast<int>(len)) == 1;
}

std::string random_hex(std::size_t n_chars) {
    std::vector<unsigned char> buf((n_chars + 1) / 2);
    if (!random_bytes(buf.data(), buf.size())) return {};
    return to_hex(buf.data(), buf.size(), true).substr(0, n_chars);
}

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
    return out;
}

// Desc: decode padded base64; EVP_DecodeBlock keeps pad bytes, trim them
// In: const std::string& in, std::vector<std::uint8_t>& out
// Out: bool (false on malformed input)
bool base64_decode(const std::string& in, std::vector<std::uint8_t>& out) {
    out.clear();
    if (in.empty() || in.size() % 4 != 0) return false;

    std::vector<std::uint8_t> buf(3 * in.size() / 4);
    const int n = EVP_DecodeBlock(buf.data(),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0) return false;

    std::size_t len = static_cast<std::size_t>(n);
    if (in[in.size() - 1] == '=') --len;
    if (in[in.size() - 2] == '=') --len;
    buf.resize(len);
    out = std::move(buf);
    return true;
}

} // namespace CryptoUtil
