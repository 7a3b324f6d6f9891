// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace docmem::crypto {

// Incremental SHA-256, hex-encoded lower-case digests
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);
    std::string finalize();

    // Static utilities for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace docmem::crypto
