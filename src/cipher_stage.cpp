#include "archivedir/cipher_stage.hpp"

#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"

#include <stdexcept>

namespace archivedir::cipher {

namespace {

crypto::KeyMaterial DeriveFor(const std::string& password, const metadata::EncryptionMetadata& meta,
                              const char* stage) {
    if (password.empty()) {
        throw StageError(stage, "encryption requires a password");
    }
    if (meta.salt.size() != constants::kSaltSize) {
        throw StageError(stage, "salt must be " + std::to_string(constants::kSaltSize) + " bytes");
    }
    if (meta.iterations == 0) {
        throw StageError(stage, "PBKDF2 iterations must be positive");
    }
    return crypto::DeriveKey(password, meta.salt, meta.iterations);
}

}  // namespace

EncryptTransform::EncryptTransform(const std::string& password, const metadata::EncryptionMetadata& meta)
    : cipher_(crypto::CbcCipher::Direction::Encrypt, DeriveFor(password, meta, "encrypt")) {}

void EncryptTransform::Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) {
    scratch_.clear();
    try {
        cipher_.Update(data, len, scratch_);
    } catch (const std::runtime_error& exc) {
        throw StageError(Name(), exc.what());
    }
    if (!scratch_.empty()) {
        out.Write(scratch_);
    }
}

void EncryptTransform::Finish(stream::ChunkSink& out) {
    scratch_.clear();
    try {
        cipher_.Finalize(scratch_);
    } catch (const std::runtime_error& exc) {
        throw StageError(Name(), exc.what());
    }
    out.Write(scratch_);
}

DecryptTransform::DecryptTransform(const std::string& password, const metadata::EncryptionMetadata& meta)
    : cipher_(crypto::CbcCipher::Direction::Decrypt, DeriveFor(password, meta, "decrypt")) {}

void DecryptTransform::Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) {
    bytes_in_ += len;
    scratch_.clear();
    try {
        cipher_.Update(data, len, scratch_);
    } catch (const std::runtime_error& exc) {
        throw DecryptionFailed(exc.what());
    }
    if (!scratch_.empty()) {
        out.Write(scratch_);
    }
}

void DecryptTransform::Finish(stream::ChunkSink& out) {
    if (bytes_in_ == 0 || bytes_in_ % constants::kAesBlockLen != 0) {
        throw DecryptionFailed("ciphertext length " + std::to_string(bytes_in_) + " is not a whole number of blocks");
    }
    scratch_.clear();
    try {
        cipher_.Finalize(scratch_);
    } catch (const std::runtime_error&) {
        throw DecryptionFailed("wrong password, wrong salt/iterations or corrupted data");
    }
    if (!scratch_.empty()) {
        out.Write(scratch_);
    }
}

}  // namespace archivedir::cipher
