#include "callguard/utils/crypto.hpp"

#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace callguard::utils {

namespace {

constexpr int kNonceSize = 12;
constexpr int kTagSize = 16;

class EvpCipherCtxPtr {
public:
    EvpCipherCtxPtr() : ptr_(EVP_CIPHER_CTX_new()) {}
    ~EvpCipherCtxPtr() { if (ptr_) EVP_CIPHER_CTX_free(ptr_); }
    EVP_CIPHER_CTX* get() const { return ptr_; }
    EvpCipherCtxPtr(const EvpCipherCtxPtr&) = delete;
    EvpCipherCtxPtr& operator=(const EvpCipherCtxPtr&) = delete;
private:
    EVP_CIPHER_CTX* ptr_;
};

class EvpMdCtxPtr {
public:
    EvpMdCtxPtr() : ptr_(EVP_MD_CTX_new()) {}
    ~EvpMdCtxPtr() { if (ptr_) EVP_MD_CTX_free(ptr_); }
    EVP_MD_CTX* get() const { return ptr_; }
    EvpMdCtxPtr(const EvpMdCtxPtr&) = delete;
    EvpMdCtxPtr& operator=(const EvpMdCtxPtr&) = delete;
private:
    EVP_MD_CTX* ptr_;
};

std::string to_hex(const unsigned char* data, size_t size) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        out << std::setw(2) << static_cast<int>(data[i]);
    }
    return out.str();
}

std::string read_all(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return to_hex(digest, sizeof(digest));
}

std::string sha256_file_hex(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    EvpMdCtxPtr ctx;
    if (!ctx.get() || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256 init failed");
    }
    std::vector<char> buffer(64 * 1024);
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = stream.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            throw std::runtime_error("sha256 update failed");
        }
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("sha256 final failed");
    }
    return to_hex(digest, length);
}

Key256 derive_key(const std::string& master_secret, const std::string& key_ref) {
    Key256 key{};
    unsigned int length = 0;
    HMAC(EVP_sha256(),
         master_secret.data(), static_cast<int>(master_secret.size()),
         reinterpret_cast<const unsigned char*>(key_ref.data()), key_ref.size(),
         key.data(), &length);
    if (length != key.size()) {
        throw std::runtime_error("key derivation failed");
    }
    return key;
}

void encrypt_file(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  const Key256& key) {
    const auto plaintext = read_all(input);

    unsigned char nonce[kNonceSize];
    if (RAND_bytes(nonce, kNonceSize) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }

    EvpCipherCtxPtr ctx;
    if (!ctx.get() ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceSize, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }

    std::vector<unsigned char> ciphertext(plaintext.size() + kTagSize);
    int written = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &written,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES-GCM encrypt failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + written, &final_len) != 1) {
        throw std::runtime_error("AES-GCM finalize failed");
    }
    written += final_len;

    unsigned char tag[kTagSize];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagSize, tag) != 1) {
        throw std::runtime_error("AES-GCM tag failed");
    }

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(nonce), kNonceSize);
    out.write(reinterpret_cast<const char*>(ciphertext.data()), written);
    out.write(reinterpret_cast<const char*>(tag), kTagSize);
    out.close();
    if (!out) {
        throw std::runtime_error("cannot write " + output.string());
    }
}

std::string decrypt_file(const std::filesystem::path& input, const Key256& key) {
    const auto blob = read_all(input);
    if (blob.size() < static_cast<size_t>(kNonceSize + kTagSize)) {
        throw std::runtime_error("ciphertext too short: " + input.string());
    }
    const auto* nonce = reinterpret_cast<const unsigned char*>(blob.data());
    const auto* body = nonce + kNonceSize;
    const int body_len = static_cast<int>(blob.size()) - kNonceSize - kTagSize;
    std::vector<unsigned char> tag(body + body_len, body + body_len + kTagSize);

    EvpCipherCtxPtr ctx;
    if (!ctx.get() ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceSize, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }

    std::vector<unsigned char> plaintext(static_cast<size_t>(body_len) + kTagSize);
    int written = 0;
    if (body_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written, body, body_len) != 1) {
        throw std::runtime_error("AES-GCM decrypt failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagSize, tag.data()) != 1) {
        throw std::runtime_error("AES-GCM tag failed");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &final_len) != 1) {
        throw std::runtime_error("AES-GCM authentication failed: " + input.string());
    }
    written += final_len;
    return std::string(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<size_t>(written));
}

}
