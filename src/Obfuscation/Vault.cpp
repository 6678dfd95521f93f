#include "Vault.hpp"
#include "CryptoUtil.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <cstdlib>
#include <iostream>
#include <memory>

const char* const kVaultNoKeyToken = "[VAULT-NO-KEY-CONFIGURED]";

namespace {

const char kStaticSalt[] = "logguard_static_salt";
const char kTokenPrefix[] = "[VAULT:";

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, void(*)(EVP_CIPHER_CTX*)>;

CipherCtx make_ctx() {
    return CipherCtx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
}

DecryptResult fail(const std::string& reason) {
    DecryptResult r;
    r.error = "Error decrypting: " + reason;
    return r;
}

} // namespace

AesGcmVault::AesGcmVault(const std::string& master_key) {
    std::string secret = master_key;
    if (secret.empty()) {
        const char* env = std::getenv("LOGGUARD_MASTER_KEY");
        if (env) secret = env;
    }
    if (!secret.empty()) {
        has_key_ = derive_key_(secret);
        if (!has_key_) std::cerr << "[Vault] key derivation failed\n";
    }
}

AesGcmVault::~AesGcmVault() {
    if (!key_.empty()) OPENSSL_cleanse(key_.data(), key_.size());
}

// Desc: derive the AES key once per vault instance
// In: const std::string& secret
// Out: bool (true on success)
bool AesGcmVault::derive_key_(const std::string& secret) {
    key_.assign(kKeyLength, 0);
    const int rc = PKCS5_PBKDF2_HMAC(
        secret.c_str(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(kStaticSalt), static_cast<int>(sizeof(kStaticSalt) - 1),
        kIterations, EVP_sha256(),
        kKeyLength, key_.data());
    if (rc != 1) {
        key_.clear();
        return false;
    }
    return true;
}

// Desc: authenticated-encrypt one value into a framed vault token
// In: const std::string& data
// Out: std::string ("[VAULT:...]" or the no-key placeholder)
std::string AesGcmVault::encrypt(const std::string& data) {
    if (!has_key_) return kVaultNoKeyToken;

    std::vector<std::uint8_t> nonce(kNonceLength);
    if (!CryptoUtil::random_bytes(nonce.data(), nonce.size())) {
        std::cerr << "[Vault] RAND_bytes failed\n";
        return kVaultNoKeyToken;
    }

    CipherCtx ctx = make_ctx();
    if (!ctx) return kVaultNoKeyToken;

    std::vector<std::uint8_t> ciphertext(data.size() + kTagLength);
    std::vector<std::uint8_t> tag(kTagLength);
    int len = 0, ct_len = 0;

    bool ok =
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceLength, nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) == 1;
    if (ok && !data.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                               reinterpret_cast<const unsigned char*>(data.data()),
                               static_cast<int>(data.size())) == 1;
        ct_len = len;
    }
    if (ok) {
        ok = EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ct_len, &len) == 1;
        ct_len += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLength, tag.data()) == 1;
    }
    if (!ok) {
        std::cerr << "[Vault] AES-GCM encryption failed\n";
        return kVaultNoKeyToken;
    }
    ciphertext.resize(ct_len);

    // nonce || ciphertext || tag
    std::vector<std::uint8_t> combined;
    combined.reserve(nonce.size() + ciphertext.size() + tag.size());
    combined.insert(combined.end(), nonce.begin(), nonce.end());
    combined.insert(combined.end(), ciphertext.begin(), ciphertext.end());
    combined.insert(combined.end(), tag.begin(), tag.end());

    return std::string(kTokenPrefix) + CryptoUtil::base64_encode(combined) + "]";
}

// Desc: strip framing, authenticate and decrypt a vault token
// In: const std::string& token (framed or bare base64)
// Out: DecryptResult (ok=false with an error for any failure)
DecryptResult AesGcmVault::decrypt(const std::string& token) const {
    if (!has_key_) return fail("no master key configured");

    std::string body = token;
    const std::size_t prefix_len = sizeof(kTokenPrefix) - 1;
    if (body.size() > prefix_len && body.compare(0, prefix_len, kTokenPrefix) == 0 && body.back() == ']') {
        body = body.substr(prefix_len, body.size() - prefix_len - 1);
    }

    std::vector<std::uint8_t> raw;
    if (!CryptoUtil::base64_decode(body, raw)) return fail("malformed token");
    if (raw.size() < static_cast<std::size_t>(kNonceLength + kTagLength)) return fail("token too short");

    const std::uint8_t* nonce = raw.data();
    const std::uint8_t* ct = raw.data() + kNonceLength;
    const int ct_len = static_cast<int>(raw.size()) - kNonceLength - kTagLength;
    std::vector<std::uint8_t> tag(raw.end() - kTagLength, raw.end());

    CipherCtx ctx = make_ctx();
    if (!ctx) return fail("cipher context allocation failed");

    std::vector<std::uint8_t> plaintext(static_cast<std::size_t>(ct_len) + 1);
    int len = 0, pt_len = 0;

    bool ok =
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceLength, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) == 1;
    if (ok && ct_len > 0) {
        ok = EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, ct_len) == 1;
        pt_len = len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLength, tag.data()) == 1;
    }
    if (!ok) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return fail("cipher setup failed");
    }

    // Authentication failure: wrong key or tampered token.
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pt_len, &len) <= 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return fail("authentication failed (wrong key or corrupt token)");
    }
    pt_len += len;

    DecryptResult r;
    r.ok = true;
    r.value.assign(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::size_t>(pt_len));
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return r;
}
