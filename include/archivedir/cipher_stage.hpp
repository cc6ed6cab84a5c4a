#pragma once

#include "archivedir/crypto.hpp"
#include "archivedir/metadata.hpp"
#include "archivedir/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace archivedir::cipher {

// AES-256-CBC over the whole stream. The output is raw ciphertext (no header,
// PKCS#7 padded); salt and iterations travel in the metadata record.
class EncryptTransform : public stream::StreamTransform {
public:
    EncryptTransform(const std::string& password, const metadata::EncryptionMetadata& meta);

    std::string Name() const override { return "encrypt"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override;
    void Finish(stream::ChunkSink& out) override;

private:
    crypto::CbcCipher cipher_;
    crypto::Bytes scratch_;
};

// Inverse of EncryptTransform. A wrong password, wrong salt/iterations and
// corrupted ciphertext all surface from Finish() as DecryptionFailed.
class DecryptTransform : public stream::StreamTransform {
public:
    DecryptTransform(const std::string& password, const metadata::EncryptionMetadata& meta);

    std::string Name() const override { return "decrypt"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override;
    void Finish(stream::ChunkSink& out) override;

private:
    crypto::CbcCipher cipher_;
    crypto::Bytes scratch_;
    std::uint64_t bytes_in_ = 0;
};

}  // namespace archivedir::cipher
