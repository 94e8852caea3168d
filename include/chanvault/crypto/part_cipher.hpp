#pragma once

#include "chanvault/core/constants.hpp"
#include "chanvault/transport/byte_source.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chanvault {

/// Fresh per-part salt: 32 random bytes, SHA-256 hashed, base64url encoded
/// (with padding). Throws std::runtime_error if the RNG fails.
std::string generate_salt();

/// Ciphertext length for a plaintext of n bytes:
/// header + n + one tag per started 64 KiB block.
uint64_t encrypted_size(uint64_t n);

/// Inverse of encrypted_size(). nullopt if n is not a valid ciphertext length.
std::optional<uint64_t> decrypted_size(uint64_t n);

/// ChaCha20-Poly1305 sealing of one part, keyed by scrypt(master key, salt).
///
/// Stream layout:
///   "CHVCRYPT" | nonce (12) | block 0 ciphertext | tag | block 1 ...
/// Each block holds up to 64 KiB of plaintext. Block i is sealed with the
/// header nonce plus i (little-endian).
class PartCipher {
public:
    using Key = std::array<uint8_t, 32>;
    using Nonce = std::array<uint8_t, constants::CIPHER_NONCE_SIZE>;

    /// Derive the part key. Throws std::runtime_error on empty master key
    /// or KDF failure.
    PartCipher(const std::string& master_key, const std::string& salt);

    /// Seal one block. out receives ciphertext followed by the tag.
    void seal_block(const Nonce& base, uint64_t index, const uint8_t* plain, size_t len,
                    std::vector<uint8_t>& out) const;

    /// Open one block (ciphertext + tag). Returns false if authentication fails.
    bool open_block(const Nonce& base, uint64_t index, const uint8_t* sealed, size_t len,
                    std::vector<uint8_t>& out) const;

    static Nonce random_nonce();

private:
    Key key_{};
};

/// Encrypts a plaintext stream of known size on the fly.
/// Produces exactly encrypted_size(plain_size) bytes.
class EncryptingSource : public transport::ByteSource {
public:
    EncryptingSource(const PartCipher& cipher, transport::ByteSource& inner, uint64_t plain_size);

    size_t read(uint8_t* buf, size_t len) override;

private:
    bool fill();

    const PartCipher& cipher_;
    transport::ByteSource& inner_;
    uint64_t remaining_;
    PartCipher::Nonce nonce_;
    uint64_t block_index_ = 0;
    std::vector<uint8_t> plain_;
    std::vector<uint8_t> pending_;
    size_t pending_pos_ = 0;
    bool header_sent_ = false;
};

/// Decrypts a ciphertext stream of known size on the fly.
/// Throws std::runtime_error on a bad header, truncation or a failed tag.
class DecryptingSource : public transport::ByteSource {
public:
    DecryptingSource(const PartCipher& cipher, transport::ByteSource& inner, uint64_t cipher_size);

    size_t read(uint8_t* buf, size_t len) override;

    /// Plaintext bytes not yet returned
    uint64_t plain_remaining() const { return plain_remaining_; }

private:
    bool fill();

    const PartCipher& cipher_;
    transport::ByteSource& inner_;
    uint64_t plain_remaining_;
    PartCipher::Nonce nonce_{};
    uint64_t block_index_ = 0;
    std::vector<uint8_t> sealed_;
    std::vector<uint8_t> pending_;
    size_t pending_pos_ = 0;
    bool header_read_ = false;
};

}  // namespace chanvault
