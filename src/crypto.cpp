#include "archivedir/crypto.hpp"

#include "archivedir/constants.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace archivedir::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    if (iterations == 0 || iterations > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("PBKDF2 iteration count out of range");
    }
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

std::string HexEncode(const Bytes& data) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

Bytes HexDecode(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = HexValue(hex[i]);
        int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

KeyMaterial DeriveKey(const std::string& password, const Bytes& salt, std::uint32_t iterations) {
    Bytes stretched = Pbkdf2HmacSha256(password, salt, iterations,
                                       constants::kAesKeyLen + constants::kAesBlockLen);
    KeyMaterial material;
    material.key.assign(stretched.begin(), stretched.begin() + constants::kAesKeyLen);
    material.iv.assign(stretched.begin() + constants::kAesKeyLen, stretched.end());
    detail::Wipe(stretched);
    return material;
}

CbcCipher::CbcCipher(Direction direction, const KeyMaterial& material)
    : direction_(direction), ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    if (material.key.size() != constants::kAesKeyLen) {
        throw std::runtime_error("AES-256-CBC expects 32-byte key");
    }
    if (material.iv.size() != constants::kAesBlockLen) {
        throw std::runtime_error("AES-256-CBC expects 16-byte IV");
    }
    int enc = direction == Direction::Encrypt ? 1 : 0;
    Ensure(EVP_CipherInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr, material.key.data(),
                             material.iv.data(), enc) == 1,
           "AES-CBC init failed");
}

void CbcCipher::Update(const std::uint8_t* data, std::size_t len, Bytes& out) {
    if (finalized_) {
        throw std::runtime_error("AES-CBC cipher already finalized");
    }
    while (len > 0) {
        // EVP takes int lengths; feed oversized inputs in slices
        int slice = static_cast<int>(std::min<std::size_t>(len, 1u << 30));
        std::size_t offset = out.size();
        out.resize(offset + static_cast<std::size_t>(slice) + constants::kAesBlockLen);
        int out_len = 0;
        Ensure(EVP_CipherUpdate(ctx_.get(), out.data() + offset, &out_len, data, slice) == 1,
               "AES-CBC update failed");
        out.resize(offset + static_cast<std::size_t>(out_len));
        data += slice;
        len -= static_cast<std::size_t>(slice);
    }
}

void CbcCipher::Finalize(Bytes& out) {
    if (finalized_) {
        throw std::runtime_error("AES-CBC cipher already finalized");
    }
    finalized_ = true;
    std::size_t offset = out.size();
    out.resize(offset + constants::kAesBlockLen);
    int out_len = 0;
    if (EVP_CipherFinal_ex(ctx_.get(), out.data() + offset, &out_len) != 1) {
        out.resize(offset);
        throw std::runtime_error(direction_ == Direction::Decrypt ? "AES-CBC bad padding"
                                                                  : "AES-CBC final failed");
    }
    out.resize(offset + static_cast<std::size_t>(out_len));
}

}  // namespace archivedir::crypto
