// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_UTIL_CRYPTOGRAPHY_HPP
#define OPTRUST_UTIL_CRYPTOGRAPHY_HPP

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using EVP_MD_CTX = struct evp_md_ctx_st;  // OpenSSL impl

namespace optrust::util
{
    /**
     * Convert a buffer of bytes to a lowercase hexadecimal string.
     */
    [[nodiscard]] auto bytes_to_hex_str(const std::byte* first, const std::byte* last) -> std::string;

    /**
     * Incremental SHA-256 hashing over OpenSSL's EVP interface.
     *
     * Failures of the underlying library are reported as `std::runtime_error`.
     */
    class Sha256Hasher
    {
    public:

        inline static constexpr std::size_t bytes_size = 32;
        inline static constexpr std::size_t hex_size = 2 * bytes_size;
        inline static constexpr std::size_t digest_size = 32768;

        using bytes_array = std::array<std::byte, bytes_size>;

        Sha256Hasher();

        /**
         * Hash a string and return the hashed bytes with hexadecimal encoding as a string.
         */
        [[nodiscard]] auto str_hex_str(std::string_view data) -> std::string;

        /**
         * Incrementally hash a file and return the hashed bytes with hexadecimal encoding as a
         * string.
         */
        [[nodiscard]] auto file_hex_str(std::ifstream& infile) -> std::string;

    private:

        struct EVPContextDeleter
        {
            void operator()(::EVP_MD_CTX* ptr) const;
        };

        void digest_start();
        void digest_update(const std::byte* buffer, std::size_t count);
        auto digest_finalize() -> bytes_array;

        std::unique_ptr<::EVP_MD_CTX, EVPContextDeleter> m_ctx;
        std::vector<std::byte> m_digest_buffer = {};
    };
}
#endif
