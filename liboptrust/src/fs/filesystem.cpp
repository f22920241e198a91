// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <fstream>
#include <sstream>
#include <vector>

#ifdef _WIN32
#include <atomic>
#include <process.h>
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#include "optrust/fs/filesystem.hpp"

namespace optrust::path
{
    auto read_contents(const fs::path& file_path) -> std::string
    {
        if (std::error_code ec; fs::is_directory(file_path, ec))
        {
            throw std::system_error(
                std::make_error_code(std::errc::is_a_directory),
                "failed to open " + file_path.string()
            );
        }

        std::ifstream in(file_path, std::ios::in | std::ios::binary);
        if (!in)
        {
            throw std::system_error(errno, std::system_category(), "failed to open " + file_path.string());
        }

        std::ostringstream contents;
        contents << in.rdbuf();
        if (in.bad())
        {
            throw std::system_error(errno, std::system_category(), "failed to read " + file_path.string());
        }
        return std::move(contents).str();
    }

    namespace
    {
        auto missing_directories(const fs::path& dir, std::error_code& ec) -> std::vector<fs::path>
        {
            auto missing = std::vector<fs::path>();
            for (auto current = dir; !current.empty(); current = current.parent_path())
            {
                if (fs::exists(current, ec) || ec)
                {
                    break;
                }
                missing.push_back(current);
                if (current == current.parent_path())
                {
                    break;
                }
            }
            return missing;
        }

        void create_private_directory(const fs::path& dir, std::error_code& ec)
        {
#ifdef _WIN32
            fs::create_directory(dir, ec);
#else
            if (::mkdir(dir.c_str(), S_IRWXU) != 0 && errno != EEXIST)
            {
                ec = std::error_code(errno, std::generic_category());
                return;
            }
#endif
            if (!ec)
            {
                // The mode given to mkdir is still filtered by the umask.
                fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
            }
        }
    }

    void create_private_directories(const fs::path& dir, std::error_code& ec)
    {
        ec.clear();
        const auto missing = missing_directories(dir, ec);
        if (ec)
        {
            return;
        }
        for (auto it = missing.crbegin(); it != missing.crend(); ++it)
        {
            create_private_directory(*it, ec);
            if (ec)
            {
                return;
            }
        }
    }

#ifdef _WIN32

    auto
    write_private_file_if_absent(const fs::path& file_path, std::string_view content, std::error_code& ec)
        -> bool
    {
        ec.clear();
        if (fs::exists(file_path, ec) || ec)
        {
            return false;
        }

        // Unique per call, also across threads of this process.
        static std::atomic<unsigned long> tmp_counter{ 0 };
        auto tmp_path = file_path;
        tmp_path += fs::path(
            "." + std::to_string(::_getpid()) + "." + std::to_string(++tmp_counter) + ".tmp"
        );
        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (!out)
            {
                std::error_code ignored;
                fs::remove(tmp_path, ignored);
                ec = std::make_error_code(std::errc::io_error);
                return false;
            }
        }
        fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            return false;
        }

        // Without MOVEFILE_REPLACE_EXISTING, the move fails if the target exists.
        if (::MoveFileExW(tmp_path.wstring().c_str(), file_path.wstring().c_str(), MOVEFILE_WRITE_THROUGH) == 0)
        {
            const auto err = ::GetLastError();
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            if (err == ERROR_ALREADY_EXISTS || err == ERROR_FILE_EXISTS)
            {
                return false;
            }
            ec = std::error_code(static_cast<int>(err), std::system_category());
            return false;
        }
        return true;
    }

#else  // #ifdef _WIN32

    namespace
    {
        void write_all(int fd, std::string_view content, std::error_code& ec)
        {
            while (!content.empty())
            {
                const auto written = ::write(fd, content.data(), content.size());
                if (written < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    ec = std::error_code(errno, std::generic_category());
                    return;
                }
                content.remove_prefix(static_cast<std::size_t>(written));
            }
            if (::fsync(fd) != 0)
            {
                ec = std::error_code(errno, std::generic_category());
            }
        }

        auto write_exclusive(const fs::path& file_path, std::string_view content, std::error_code& ec)
            -> bool
        {
            const int fd = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
            if (fd < 0)
            {
                if (errno == EEXIST)
                {
                    return false;
                }
                ec = std::error_code(errno, std::generic_category());
                return false;
            }
            write_all(fd, content, ec);
            if (::close(fd) != 0 && !ec)
            {
                ec = std::error_code(errno, std::generic_category());
            }
            if (ec)
            {
                ::unlink(file_path.c_str());
                return false;
            }
            return true;
        }
    }

    auto
    write_private_file_if_absent(const fs::path& file_path, std::string_view content, std::error_code& ec)
        -> bool
    {
        ec.clear();
        if (fs::exists(file_path, ec) || ec)
        {
            return false;
        }

        auto tmp_template = file_path.string() + ".XXXXXX";
        // mkstemp creates the file with 0600 permissions.
        const int fd = ::mkstemp(tmp_template.data());
        if (fd < 0)
        {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        write_all(fd, content, ec);
        if (::close(fd) != 0 && !ec)
        {
            ec = std::error_code(errno, std::generic_category());
        }
        if (ec)
        {
            ::unlink(tmp_template.c_str());
            return false;
        }

        // link(2) fails with EEXIST instead of replacing an existing target.
        const int link_res = ::link(tmp_template.c_str(), file_path.c_str());
        const int link_errno = errno;
        ::unlink(tmp_template.c_str());
        if (link_res == 0)
        {
            return true;
        }
        if (link_errno == EEXIST)
        {
            return false;
        }
        if (link_errno == EPERM || link_errno == ENOSYS || link_errno == EOPNOTSUPP)
        {
            // Hard links are not available on every file system.
            return write_exclusive(file_path, content, ec);
        }
        ec = std::error_code(link_errno, std::generic_category());
        return false;
    }

#endif  // #ifdef _WIN32
}
