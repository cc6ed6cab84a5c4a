#pragma once

#include "archivedir/crypto_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace archivedir::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

std::string HexEncode(const Bytes& data);
// Throws std::invalid_argument on odd length or non-hex characters.
Bytes HexDecode(std::string_view hex);

struct KeyMaterial {
    Bytes key;  // 32 bytes
    Bytes iv;   // 16 bytes

    ~KeyMaterial() {
        detail::Wipe(key);
        detail::Wipe(iv);
    }
};

// PBKDF2-SHA256(password, salt, iterations) stretched to 48 bytes: the first 32
// are the AES-256 key, the last 16 the CBC initialisation vector.
KeyMaterial DeriveKey(const std::string& password, const Bytes& salt, std::uint32_t iterations);

// Incremental AES-256-CBC with PKCS#7 padding. Update() may return fewer bytes
// than it was given; Finalize() flushes the last block (and checks the padding
// when decrypting).
class CbcCipher {
public:
    enum class Direction { Encrypt, Decrypt };

    CbcCipher(Direction direction, const KeyMaterial& material);

    CbcCipher(const CbcCipher&) = delete;
    CbcCipher& operator=(const CbcCipher&) = delete;

    void Update(const std::uint8_t* data, std::size_t len, Bytes& out);
    // Throws std::runtime_error on bad padding when decrypting.
    void Finalize(Bytes& out);

    Direction direction() const noexcept { return direction_; }

private:
    Direction direction_;
    detail::UniqueCipherCtx ctx_;
    bool finalized_ = false;
};

}  // namespace archivedir::crypto
