#pragma once

#include "io/io.hpp"
#include "util/cancel_token.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace lsmux {

// Lowercase hex digests, empty on failure.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view data);
std::string Sha256Hex(IReader& reader);

// Streams the file through the hasher in fixed-size chunks.
Result Sha256HexFile(const std::string& path,
                     std::string& out_hex,
                     const CancelToken* cancel = nullptr);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lsmux
