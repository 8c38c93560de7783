#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace callguard::utils {

using Key256 = std::array<uint8_t, 32>;

std::string sha256_hex(const std::string& data);
std::string sha256_file_hex(const std::filesystem::path& path);

// HMAC-SHA256(master_secret, key_ref); one data key per recording.
Key256 derive_key(const std::string& master_secret, const std::string& key_ref);

// Output layout: 12-byte nonce | ciphertext | 16-byte GCM tag.
void encrypt_file(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  const Key256& key);
std::string decrypt_file(const std::filesystem::path& input, const Key256& key);

}
