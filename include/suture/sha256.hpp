#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace suture {

class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finalize();

    static std::string hash_hex(const std::string& input);
    static std::string to_hex(const Digest& bytes);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> state_;
    uint64_t length_ = 0;          // bytes consumed so far
    std::array<uint8_t, 64> pending_{};
    size_t pending_len_ = 0;
};

// Cache-key builder. Each field is length-prefixed before hashing so that
// ("ab", "c") and ("a", "bc") never collide.
class Fingerprint {
public:
    explicit Fingerprint(const std::string& domain);

    Fingerprint& add(const std::string& field);
    Fingerprint& add(uint64_t field);

    std::string hex();

private:
    SHA256 hasher_;
};

} // namespace suture
