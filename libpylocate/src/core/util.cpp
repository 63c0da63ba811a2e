// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#ifndef _WIN32
#include <stdlib.h>
#else
#include <io.h>
#endif

#include "pylocate/core/logging.hpp"
#include "pylocate/core/util.hpp"

namespace pylocate
{
    std::string read_contents(const fs::u8path& file_path, std::ios::openmode mode)
    {
        std::ifstream in(file_path.std_path(), std::ios::in | mode);

        if (in)
        {
            std::string contents;
            in.seekg(0, std::ios::end);
            contents.resize(static_cast<std::size_t>(in.tellg()));
            in.seekg(0, std::ios::beg);
            in.read(contents.data(), static_cast<std::streamsize>(contents.size()));
            in.close();
            return contents;
        }
        else
        {
            throw std::system_error(
                errno,
                std::system_category(),
                "failed to open " + file_path.string()
            );
        }
    }

    TemporaryDirectory::TemporaryDirectory()
    {
        bool success = false;
#ifndef _WIN32
        std::string template_path = (fs::temp_directory_path() / "pylocatedXXXXXX").string();
        char* pth = ::mkdtemp(template_path.data());
        success = (pth != nullptr);
#else
        std::string template_path = (fs::temp_directory_path() / "pylocatedXXXXXX").string();
        // include \0 terminator
        success = (::_mktemp_s(template_path.data(), template_path.size() + 1) == 0)
                  && fs::create_directory(template_path);
#endif
        if (!success)
        {
            throw std::runtime_error("Could not create temporary directory!");
        }
        m_path = template_path;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec)
        {
            LOG_WARNING << "Could not remove temporary directory " << m_path << ": "
                        << ec.message();
        }
    }

    const fs::u8path& TemporaryDirectory::path() const
    {
        return m_path;
    }

    TemporaryDirectory::operator fs::u8path()
    {
        return m_path;
    }
}
