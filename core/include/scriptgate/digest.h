#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace scriptgate {

// A trusted content digest: lowercase hex, no metadata.
using TrustEntry = std::string;

namespace digest {

// ---------- SHA-256 (streaming) ----------
// Feed bytes with update(), read the result once with finish().
class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> finish();

private:
    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
    bool finished_{false};
};

std::string to_hex(const uint8_t* data, size_t n);

std::string sha256_hex(const std::string& s);

// SHA-256 of a file's contents (empty string on error).
std::string sha256_hex_file(const std::filesystem::path& path);

// ---------- Trust digests ----------
// The digest every trust comparison is based on. Changing the algorithm here
// invalidates every stored trust entry.
TrustEntry of(const std::string& content);

// Trim surrounding whitespace and lowercase. Used on every entry that enters
// a trust set and on every lookup key.
TrustEntry normalize(const std::string& raw);

// True if `s` has the shape of of()'s output (64 lowercase hex chars).
bool is_sha256_hex(const std::string& s);

} // namespace digest
} // namespace scriptgate
