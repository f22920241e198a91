// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_FS_FILESYSTEM_HPP
#define OPTRUST_FS_FILESYSTEM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace optrust
{
    namespace fs = std::filesystem;

    namespace path
    {
        /**
         * Read the whole content of a file in binary mode.
         *
         * Throws a `std::system_error` if the file cannot be opened or read.
         */
        [[nodiscard]] auto read_contents(const fs::path& file_path) -> std::string;

        /**
         * Create the directory and its missing parents, each created directory being
         * accessible by its owner only.
         *
         * Directories that already exist are left untouched.
         */
        void create_private_directories(const fs::path& dir, std::error_code& ec);

        /**
         * Write a file readable and writable by its owner only, if it does not exist.
         *
         * The content is first written to a temporary file in the same directory which is
         * then moved in place without ever replacing an existing file, so that no reader
         * can observe a partially written file.
         *
         * @return `true` if the file was written, `false` if it already existed.
         */
        [[nodiscard]] auto
        write_private_file_if_absent(const fs::path& file_path, std::string_view content, std::error_code& ec)
            -> bool;
    }
}
#endif
