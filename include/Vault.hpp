#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Outcome of a decrypt call; value is only meaningful when ok is true.
struct DecryptResult {
    bool ok = false;
    std::string value;
    std::string error;
};

// Reversible obfuscation backend (built-in AES vault, tokenization service, ...).
class VaultInterface {
public:
    virtual ~VaultInterface() = default;
    virtual std::string encrypt(const std::string& data) = 0;
    virtual DecryptResult decrypt(const std::string& token) const = 0;
};

// PBKDF2-HMAC-SHA256 derived key + AES-256-GCM.
// Token: "[VAULT:" + base64(nonce || ciphertext || tag) + "]".
class AesGcmVault : public VaultInterface {
public:
    static const int kIterations = 100000;
    static const int kKeyLength = 32;
    static const int kNonceLength = 12;
    static const int kTagLength = 16;

    // Empty master_key falls back to LOGGUARD_MASTER_KEY.
    explicit AesGcmVault(const std::string& master_key = "");
    ~AesGcmVault() override;

    AesGcmVault(const AesGcmVault&) = delete;
    AesGcmVault& operator=(const AesGcmVault&) = delete;

    bool has_key() const { return has_key_; }

    std::string encrypt(const std::string& data) override;
    DecryptResult decrypt(const std::string& token) const override;

private:
    bool derive_key_(const std::string& secret);

    std::vector<std::uint8_t> key_;
    bool has_key_{false};
};

extern const char* const kVaultNoKeyToken;
