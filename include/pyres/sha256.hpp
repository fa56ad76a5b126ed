#pragma once

#include <pyres/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace pyres {

// Streaming SHA-256 (FIPS 180-4), used to verify downloaded artifacts
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const void* data, size_t len);
    void update(const std::string& s) { update(s.data(), s.size()); }

    // Pads and returns the digest; the object is spent afterwards
    Digest finish();
    std::string finish_hex() { return to_hex(finish()); }

    static std::string of(const std::string& data);
    static Result<std::string> of_file(const std::filesystem::path& path);
    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    uint8_t pending_[64];
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

// Checks data against an index hash map ("sha256" -> hex). Files listed
// without a sha256 entry pass unchecked.
Status verify_sha256(const std::string& data,
                     const std::map<std::string, std::string>& hashes,
                     const std::string& what);

} // namespace pyres
