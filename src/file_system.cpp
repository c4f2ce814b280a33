//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/error.hpp>
#include <boost/http_proto/file.hpp>
#include <boost/system/errc.hpp>
#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>

namespace boost {
namespace tryfiles {

file_system::
~file_system() = default;

//------------------------------------------------

namespace {

// Reads at most n bytes from the current position
// of an open file, stopping early only at EOF.
std::string
read_some(
    http::file& f,
    std::uint64_t n,
    system::error_code& ec)
{
    std::string s;
    std::size_t const size = static_cast<std::size_t>(n);
    s.resize(size);
    std::size_t total = 0;
    while(total < size)
    {
        auto const nread = f.read(
            &s[total], size - total, ec);
        if(ec.failed())
            return {};
        if(nread == 0)
            break;
        total += nread;
    }
    s.resize(total);
    return s;
}

} // (anon)

file_info
native_file_system::
stat(
    core::string_view path,
    system::error_code& ec)
{
    file_info fi;
    std::string const p(path);

#ifdef _WIN32
    struct _stat64 st;
    if(::_stat64(p.c_str(), &st) != 0)
#else
    struct ::stat st;
    if(::stat(p.c_str(), &st) != 0)
#endif
    {
        int const ev = errno;
        // a file used as a directory is still "not found"
        if( ev == ENOENT ||
            ev == ENOTDIR)
            ec = system::errc::make_error_code(
                system::errc::no_such_file_or_directory);
        else
            ec = system::error_code(
                ev, system::system_category());
        return fi;
    }

    ec = {};
#ifdef _WIN32
    fi.is_file = (st.st_mode & _S_IFMT) == _S_IFREG;
    fi.is_directory = (st.st_mode & _S_IFMT) == _S_IFDIR;
    fi.mtime = static_cast<std::int64_t>(st.st_mtime) * 1000;
#else
    fi.is_file = S_ISREG(st.st_mode);
    fi.is_directory = S_ISDIR(st.st_mode);
# if defined(__APPLE__)
    fi.mtime =
        static_cast<std::int64_t>(st.st_mtimespec.tv_sec) * 1000 +
        st.st_mtimespec.tv_nsec / 1000000;
# else
    fi.mtime =
        static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000 +
        st.st_mtim.tv_nsec / 1000000;
# endif
#endif
    if(fi.is_file)
        fi.size = static_cast<std::uint64_t>(st.st_size);
    return fi;
}

std::string
native_file_system::
read_all(
    core::string_view path,
    system::error_code& ec)
{
    http::file f;
    f.open(std::string(path).c_str(),
        http::file_mode::read, ec);
    if(ec.failed())
        return {};
    auto const size = f.size(ec);
    if(ec.failed())
        return {};
    auto s = read_some(f, size, ec);
    if(ec.failed())
        return {};
    if(s.size() != size)
    {
        // truncated while reading
        ec = BOOST_TRYFILES_ERR(error::short_read);
        return {};
    }
    return s;
}

std::string
native_file_system::
read_range(
    core::string_view path,
    std::uint64_t offset,
    std::uint64_t n,
    system::error_code& ec)
{
    http::file f;
    f.open(std::string(path).c_str(),
        http::file_mode::read, ec);
    if(ec.failed())
        return {};
    f.seek(offset, ec);
    if(ec.failed())
        return {};
    return read_some(f, n, ec);
}

} // tryfiles
} // boost
