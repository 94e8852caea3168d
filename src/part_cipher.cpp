#include "chanvault/crypto/part_cipher.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace chanvault {

namespace {

using namespace constants;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

PartCipher::Nonce block_nonce(const PartCipher::Nonce& base, uint64_t index) {
    PartCipher::Nonce nonce = base;
    unsigned carry = 0;
    for (size_t i = 0; i < nonce.size(); ++i) {
        unsigned sum = nonce[i] + static_cast<unsigned>(index & 0xFF) + carry;
        nonce[i] = static_cast<uint8_t>(sum & 0xFF);
        carry = sum >> 8;
        index >>= 8;
    }
    return nonce;
}

std::string base64url_encode(const uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                            static_cast<int>(len));
    out.resize(static_cast<size_t>(n));
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

}  // namespace

std::string generate_salt() {
    uint8_t random[SALT_RANDOM_BYTES];
    if (RAND_bytes(random, sizeof(random)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(random, sizeof(random), hash);
    return base64url_encode(hash, sizeof(hash));
}

uint64_t encrypted_size(uint64_t n) {
    uint64_t blocks = (n + CIPHER_BLOCK_SIZE - 1) / CIPHER_BLOCK_SIZE;
    return CIPHER_HEADER_SIZE + n + CIPHER_TAG_SIZE * blocks;
}

std::optional<uint64_t> decrypted_size(uint64_t n) {
    if (n < CIPHER_HEADER_SIZE) return std::nullopt;
    uint64_t body = n - CIPHER_HEADER_SIZE;
    constexpr uint64_t sealed_block = CIPHER_BLOCK_SIZE + CIPHER_TAG_SIZE;
    uint64_t blocks = (body + sealed_block - 1) / sealed_block;
    if (body < blocks * CIPHER_TAG_SIZE) return std::nullopt;
    uint64_t plain = body - blocks * CIPHER_TAG_SIZE;
    if (encrypted_size(plain) != n) return std::nullopt;
    return plain;
}

// ============================================================================
// PartCipher
// ============================================================================

PartCipher::PartCipher(const std::string& master_key, const std::string& salt) {
    if (master_key.empty()) {
        throw std::runtime_error("encryption key is empty");
    }
    if (EVP_PBE_scrypt(master_key.data(), master_key.size(),
                       reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                       SCRYPT_N, SCRYPT_R, SCRYPT_P, 0,
                       key_.data(), key_.size()) != 1) {
        throw std::runtime_error("scrypt key derivation failed");
    }
}

PartCipher::Nonce PartCipher::random_nonce() {
    Nonce nonce;
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return nonce;
}

void PartCipher::seal_block(const Nonce& base, uint64_t index, const uint8_t* plain, size_t len,
                            std::vector<uint8_t>& out) const {
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    auto nonce = block_nonce(base, index);
    out.resize(len + CIPHER_TAG_SIZE);
    int out_len = 0;
    int final_len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plain, static_cast<int>(len)) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(CIPHER_TAG_SIZE),
                            out.data() + len) != 1) {
        throw std::runtime_error("block encryption failed");
    }
}

bool PartCipher::open_block(const Nonce& base, uint64_t index, const uint8_t* sealed, size_t len,
                            std::vector<uint8_t>& out) const {
    if (len < CIPHER_TAG_SIZE) return false;
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    auto nonce = block_nonce(base, index);
    size_t body = len - CIPHER_TAG_SIZE;
    std::array<uint8_t, CIPHER_TAG_SIZE> tag;
    std::memcpy(tag.data(), sealed + body, CIPHER_TAG_SIZE);
    out.resize(body);
    int out_len = 0;
    int final_len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1 ||
        EVP_DecryptUpdate(ctx.get(), out.data(), &out_len, sealed, static_cast<int>(body)) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(CIPHER_TAG_SIZE),
                            tag.data()) != 1) {
        throw std::runtime_error("block decryption failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        out.clear();
        return false;
    }
    return true;
}

// ============================================================================
// EncryptingSource
// ============================================================================

EncryptingSource::EncryptingSource(const PartCipher& cipher, transport::ByteSource& inner,
                                   uint64_t plain_size)
    : cipher_(cipher)
    , inner_(inner)
    , remaining_(plain_size)
    , nonce_(PartCipher::random_nonce())
    , plain_(CIPHER_BLOCK_SIZE) {}

bool EncryptingSource::fill() {
    pending_.clear();
    pending_pos_ = 0;
    if (!header_sent_) {
        header_sent_ = true;
        pending_.insert(pending_.end(), CIPHER_MAGIC, CIPHER_MAGIC + CIPHER_MAGIC_SIZE);
        pending_.insert(pending_.end(), nonce_.begin(), nonce_.end());
        return true;
    }
    if (remaining_ == 0) {
        uint8_t extra;
        if (inner_.read(&extra, 1) != 0) {
            throw std::runtime_error("plaintext stream longer than declared size");
        }
        return false;
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(CIPHER_BLOCK_SIZE, remaining_));
    size_t got = transport::read_full(inner_, plain_.data(), want);
    if (got != want) {
        throw std::runtime_error("plaintext stream ended early");
    }
    cipher_.seal_block(nonce_, block_index_++, plain_.data(), got, pending_);
    remaining_ -= got;
    return true;
}

size_t EncryptingSource::read(uint8_t* buf, size_t len) {
    if (pending_pos_ >= pending_.size() && !fill()) return 0;
    size_t n = std::min(len, pending_.size() - pending_pos_);
    std::memcpy(buf, pending_.data() + pending_pos_, n);
    pending_pos_ += n;
    return n;
}

// ============================================================================
// DecryptingSource
// ============================================================================

DecryptingSource::DecryptingSource(const PartCipher& cipher, transport::ByteSource& inner,
                                   uint64_t cipher_size)
    : cipher_(cipher)
    , inner_(inner)
    , sealed_(CIPHER_BLOCK_SIZE + CIPHER_TAG_SIZE) {
    auto plain = decrypted_size(cipher_size);
    if (!plain) {
        throw std::runtime_error("invalid ciphertext size " + std::to_string(cipher_size));
    }
    plain_remaining_ = *plain;
}

bool DecryptingSource::fill() {
    pending_pos_ = 0;
    pending_.clear();
    if (!header_read_) {
        uint8_t header[CIPHER_HEADER_SIZE];
        if (transport::read_full(inner_, header, sizeof(header)) != sizeof(header)) {
            throw std::runtime_error("ciphertext truncated in header");
        }
        if (std::memcmp(header, CIPHER_MAGIC, CIPHER_MAGIC_SIZE) != 0) {
            throw std::runtime_error("bad ciphertext header");
        }
        std::memcpy(nonce_.data(), header + CIPHER_MAGIC_SIZE, nonce_.size());
        header_read_ = true;
    }
    if (plain_remaining_ == 0) return false;

    size_t plain_len = static_cast<size_t>(std::min<uint64_t>(CIPHER_BLOCK_SIZE, plain_remaining_));
    size_t want = plain_len + CIPHER_TAG_SIZE;
    if (transport::read_full(inner_, sealed_.data(), want) != want) {
        throw std::runtime_error("ciphertext truncated");
    }
    if (!cipher_.open_block(nonce_, block_index_, sealed_.data(), want, pending_)) {
        throw std::runtime_error("authentication failed for block " + std::to_string(block_index_));
    }
    ++block_index_;
    plain_remaining_ -= plain_len;
    return true;
}

size_t DecryptingSource::read(uint8_t* buf, size_t len) {
    while (pending_pos_ >= pending_.size()) {
        if (!fill()) return 0;
    }
    size_t n = std::min(len, pending_.size() - pending_pos_);
    std::memcpy(buf, pending_.data() + pending_pos_, n);
    pending_pos_ += n;
    return n;
}

}  // namespace chanvault
