// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <stdexcept>

#include <openssl/evp.h>

#include "optrust/util/cryptography.hpp"

namespace optrust::util
{
    auto bytes_to_hex_str(const std::byte* first, const std::byte* last) -> std::string
    {
        static constexpr std::string_view hex_chars = "0123456789abcdef";
        auto out = std::string();
        out.reserve(2 * static_cast<std::size_t>(last - first));
        for (; first != last; ++first)
        {
            const auto val = std::to_integer<unsigned char>(*first);
            out.push_back(hex_chars[val >> 4]);
            out.push_back(hex_chars[val & 0x0F]);
        }
        return out;
    }

    void Sha256Hasher::EVPContextDeleter::operator()(::EVP_MD_CTX* ptr) const
    {
        if (ptr)
        {
            ::EVP_MD_CTX_free(ptr);
        }
    }

    Sha256Hasher::Sha256Hasher()
        : m_ctx(::EVP_MD_CTX_new())
    {
        if (!m_ctx)
        {
            throw std::runtime_error("Failed to create OpenSSL digest context");
        }
    }

    void Sha256Hasher::digest_start()
    {
        if (::EVP_DigestInit_ex(m_ctx.get(), ::EVP_sha256(), nullptr) != 1)
        {
            throw std::runtime_error("Failed to initialize SHA-256 digest");
        }
    }

    void Sha256Hasher::digest_update(const std::byte* buffer, std::size_t count)
    {
        if (::EVP_DigestUpdate(m_ctx.get(), buffer, count) != 1)
        {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }

    auto Sha256Hasher::digest_finalize() -> bytes_array
    {
        auto out = bytes_array{};
        if (::EVP_DigestFinal_ex(m_ctx.get(), reinterpret_cast<unsigned char*>(out.data()), nullptr) != 1)
        {
            throw std::runtime_error("Failed to finalize SHA-256 digest");
        }
        return out;
    }

    auto Sha256Hasher::str_hex_str(std::string_view data) -> std::string
    {
        digest_start();
        auto iter = reinterpret_cast<const std::byte*>(data.data());
        auto remaining = data.size();
        while (remaining > 0)
        {
            const auto taken = std::min(remaining, digest_size);
            digest_update(iter, taken);
            remaining -= taken;
            iter += taken;
        }
        const auto bytes = digest_finalize();
        return bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size());
    }

    auto Sha256Hasher::file_hex_str(std::ifstream& infile) -> std::string
    {
        m_digest_buffer.assign(digest_size, std::byte(0));
        digest_start();

        while (infile)
        {
            infile.read(reinterpret_cast<char*>(m_digest_buffer.data()), digest_size);
            const auto count = static_cast<std::size_t>(infile.gcount());
            if (!count)
            {
                break;
            }
            digest_update(m_digest_buffer.data(), count);
        }
        if (infile.bad())
        {
            throw std::runtime_error("Failed to read file while computing SHA-256 digest");
        }
        const auto bytes = digest_finalize();
        return bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size());
    }
}
