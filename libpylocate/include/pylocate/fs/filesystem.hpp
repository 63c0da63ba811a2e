// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_FS_FILESYSTEM_HPP
#define PYLOCATE_FS_FILESYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace pylocate::fs
{
    // Use `\` on Windows, leave the path untouched elsewhere.
    std::filesystem::path normalized_separators(std::filesystem::path path);

    std::string to_utf8(const std::filesystem::path& path);

    std::filesystem::path from_utf8(std::string_view u8string);

    /**
     * A path whose narrow string form is UTF-8 on every platform.
     *
     * Strings given to and returned by a ``u8path`` are UTF-8. The wrapped
     * ``std::filesystem::path`` is reachable through ``std_path`` for the standard library.
     */
    class u8path
    {
    public:

        u8path() = default;
        u8path(const std::filesystem::path& path);
        u8path(std::string_view u8string);
        u8path(const std::string& u8string);
        u8path(const char* u8string);

        [[nodiscard]] std::string string() const;

        [[nodiscard]] const std::filesystem::path& std_path() const noexcept
        {
            return m_path;
        }

        [[nodiscard]] u8path parent_path() const;
        [[nodiscard]] u8path filename() const;

        [[nodiscard]] bool empty() const noexcept
        {
            return m_path.empty();
        }

        friend u8path operator/(const u8path& parent, const u8path& child);

        friend bool operator==(const u8path& lhs, const u8path& rhs) noexcept
        {
            return lhs.m_path == rhs.m_path;
        }

        // Quoted, as std::filesystem::path does.
        friend std::ostream& operator<<(std::ostream& out, const u8path& path);

    private:

        std::filesystem::path m_path;
    };

    class directory_entry
    {
    public:

        directory_entry() = default;
        explicit directory_entry(std::filesystem::directory_entry entry);

        [[nodiscard]] u8path path() const;

        [[nodiscard]] bool is_directory() const;
        [[nodiscard]] bool is_directory(std::error_code& ec) const noexcept;

    private:

        std::filesystem::directory_entry m_entry;
    };

    /**
     * Iterate over the entries of a directory, yielding `directory_entry`.
     *
     * The default constructed iterator is the end iterator.
     */
    class directory_iterator
    {
    public:

        using iterator_category = std::input_iterator_tag;
        using value_type = directory_entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const directory_entry*;
        using reference = const directory_entry&;

        directory_iterator() = default;
        explicit directory_iterator(const u8path& dir);
        directory_iterator(const u8path& dir, std::error_code& ec);

        reference operator*() const;
        pointer operator->() const;

        directory_iterator& operator++();
        directory_iterator& increment(std::error_code& ec);

        friend bool operator==(const directory_iterator& lhs, const directory_iterator& rhs) noexcept
        {
            return lhs.m_iter == rhs.m_iter;
        }

    private:

        std::filesystem::directory_iterator m_iter;
        mutable directory_entry m_current;
    };

    inline directory_iterator begin(directory_iterator iter) noexcept
    {
        return iter;
    }

    inline directory_iterator end(const directory_iterator&) noexcept
    {
        return {};
    }

    [[nodiscard]] bool exists(const u8path& path, std::error_code& ec) noexcept;
    [[nodiscard]] bool is_regular_file(const u8path& path, std::error_code& ec) noexcept;

    bool create_directory(const u8path& path);
    bool create_directories(const u8path& path);
    void create_directory_symlink(const u8path& target, const u8path& link);

    std::uintmax_t remove_all(const u8path& path, std::error_code& ec);

    [[nodiscard]] u8path temp_directory_path();
}

template <>
struct fmt::formatter<::pylocate::fs::u8path> : fmt::formatter<std::string>
{
    template <class FormatContext>
    auto format(const ::pylocate::fs::u8path& path, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(fmt::format("'{}'", path.string()), ctx);
    }
};

#endif
