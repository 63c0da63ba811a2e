// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <utility>

#include "pylocate/fs/filesystem.hpp"
#include "pylocate/util/build.hpp"
#include "pylocate/util/encoding.hpp"

namespace pylocate::fs
{
    std::filesystem::path normalized_separators(std::filesystem::path path)
    {
        if constexpr (util::on_win)
        {
            auto native = path.native();
            std::replace(native.begin(), native.end(), L'/', L'\\');
            return native;
        }
        return path;
    }

    std::string to_utf8(const std::filesystem::path& path)
    {
        return util::to_utf8_std_string(normalized_separators(path).u8string());
    }

    std::filesystem::path from_utf8(std::string_view u8string)
    {
        return normalized_separators(util::to_u8string(u8string));
    }

    /**********
     * u8path *
     **********/

    u8path::u8path(const std::filesystem::path& path)
        : m_path(normalized_separators(path))
    {
    }

    u8path::u8path(std::string_view u8string)
        : m_path(from_utf8(u8string))
    {
    }

    u8path::u8path(const std::string& u8string)
        : u8path(std::string_view(u8string))
    {
    }

    u8path::u8path(const char* u8string)
        : u8path(std::string_view(u8string))
    {
    }

    std::string u8path::string() const
    {
        return to_utf8(m_path);
    }

    u8path u8path::parent_path() const
    {
        return m_path.parent_path();
    }

    u8path u8path::filename() const
    {
        return m_path.filename();
    }

    u8path operator/(const u8path& parent, const u8path& child)
    {
        return parent.m_path / child.m_path;
    }

    std::ostream& operator<<(std::ostream& out, const u8path& path)
    {
        return out << std::quoted(path.string());
    }

    /*******************
     * directory_entry *
     *******************/

    directory_entry::directory_entry(std::filesystem::directory_entry entry)
        : m_entry(std::move(entry))
    {
    }

    u8path directory_entry::path() const
    {
        return m_entry.path();
    }

    bool directory_entry::is_directory() const
    {
        return m_entry.is_directory();
    }

    bool directory_entry::is_directory(std::error_code& ec) const noexcept
    {
        return m_entry.is_directory(ec);
    }

    /**********************
     * directory_iterator *
     **********************/

    directory_iterator::directory_iterator(const u8path& dir)
        : m_iter(dir.std_path())
    {
    }

    directory_iterator::directory_iterator(const u8path& dir, std::error_code& ec)
        : m_iter(dir.std_path(), ec)
    {
    }

    auto directory_iterator::operator*() const -> reference
    {
        m_current = directory_entry(*m_iter);
        return m_current;
    }

    auto directory_iterator::operator->() const -> pointer
    {
        return &(**this);
    }

    directory_iterator& directory_iterator::operator++()
    {
        ++m_iter;
        return *this;
    }

    directory_iterator& directory_iterator::increment(std::error_code& ec)
    {
        m_iter.increment(ec);
        return *this;
    }

    /******************
     * free functions *
     ******************/

    bool exists(const u8path& path, std::error_code& ec) noexcept
    {
        return std::filesystem::exists(path.std_path(), ec);
    }

    bool is_regular_file(const u8path& path, std::error_code& ec) noexcept
    {
        return std::filesystem::is_regular_file(path.std_path(), ec);
    }

    bool create_directory(const u8path& path)
    {
        return std::filesystem::create_directory(path.std_path());
    }

    bool create_directories(const u8path& path)
    {
        return std::filesystem::create_directories(path.std_path());
    }

    void create_directory_symlink(const u8path& target, const u8path& link)
    {
        std::filesystem::create_directory_symlink(target.std_path(), link.std_path());
    }

    std::uintmax_t remove_all(const u8path& path, std::error_code& ec)
    {
        return std::filesystem::remove_all(path.std_path(), ec);
    }

    u8path temp_directory_path()
    {
        return std::filesystem::temp_directory_path();
    }
}
