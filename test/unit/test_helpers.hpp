//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_TEST_TEST_HELPERS_HPP
#define BOOST_TRYFILES_TEST_TEST_HELPERS_HPP

#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/error.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/fields_base.hpp>
#include <boost/http_proto/method.hpp>
#include <boost/http_proto/request.hpp>
#include <boost/http_proto/version.hpp>
#include <boost/url/parse.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/core/lightweight_test.hpp>
#include <boost/system/errc.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

namespace boost {
namespace tryfiles {
namespace test {

struct suite_info
{
    char const* name;
    void(*run)();
};

inline
std::vector<suite_info>&
suites()
{
    static std::vector<suite_info> v;
    return v;
}

struct suite_registrar
{
    suite_registrar(
        char const* name,
        void(*run)())
    {
        suites().push_back({ name, run });
    }
};

/** Run the io_context until it is out of work

    @return The number of handlers invoked.
*/
inline
std::size_t
run(asio::io_context& ioc)
{
    std::size_t n = ioc.run();
    ioc.restart();
    return n;
}

/** Connect two TCP sockets together.
*/
template<class Executor>
bool
connect(
    asio::io_context& ioc,
    asio::basic_stream_socket<asio::ip::tcp, Executor>& s1,
    asio::basic_stream_socket<asio::ip::tcp, Executor>& s2)
{
    asio::basic_socket_acceptor<
        asio::ip::tcp, Executor> a(s1.get_executor());
    auto ep = asio::ip::tcp::endpoint(
        asio::ip::make_address_v4("127.0.0.1"), 0);
    a.open(ep.protocol());
    a.set_option(
        asio::socket_base::reuse_address(true));
    a.bind(ep);
    a.listen(0);
    ep = a.local_endpoint();
    a.async_accept(s2, asio::detached);
    s1.async_connect(ep, asio::detached);
    run(ioc);
    if(s1.remote_endpoint() != s2.local_endpoint())
        return false;
    if(s2.remote_endpoint() != s1.local_endpoint())
        return false;
    return true;
}

/** Return the value of a field, or the empty string
*/
inline
std::string
field_value(
    http::fields_base const& f,
    http::field id)
{
    auto it = f.find(id);
    if(it == f.end())
        return {};
    return std::string(it->value);
}

/** Builds a request as presented to handlers
*/
class request_builder
{
    http::request m_;
    urls::url_view u_;

public:
    request_builder(
        http::method method,
        core::string_view target)
    {
        m_.set_start_line(method, target,
            http::version::http_1_1);
    }

    request_builder&
    set(http::field id, core::string_view value)
    {
        m_.set(id, value);
        return *this;
    }

    // the result refers to this object
    request
    get()
    {
        u_ = urls::parse_uri_reference(
            m_.target()).value();
        return request{ m_, u_, {} };
    }
};

//------------------------------------------------

/** A directory of files removed on destruction
*/
class temp_dir
{
    std::string path_;
    std::vector<std::string> files_;
    std::vector<std::string> dirs_;

public:
    temp_dir()
    {
        char buf[] = "/tmp/tryfiles_XXXXXX";
        char* p = ::mkdtemp(buf);
        if(p)
            path_ = p;
        BOOST_TEST(! path_.empty());
    }

    ~temp_dir()
    {
        for(auto it = files_.rbegin(); it != files_.rend(); ++it)
            std::remove(it->c_str());
        for(auto it = dirs_.rbegin(); it != dirs_.rend(); ++it)
            ::rmdir(it->c_str());
        ::rmdir(path_.c_str());
    }

    std::string const&
    path() const noexcept
    {
        return path_;
    }

    // rel must not start with a slash
    std::string
    mkdir(std::string const& rel)
    {
        auto p = path_ + "/" + rel;
        BOOST_TEST_EQ(::mkdir(p.c_str(), 0755), 0);
        dirs_.push_back(p);
        return p;
    }

    std::string
    write(
        std::string const& rel,
        std::string const& body)
    {
        auto p = path_ + "/" + rel;
        std::ofstream os(p, std::ios::binary);
        os.write(body.data(),
            static_cast<std::streamsize>(body.size()));
        BOOST_TEST(os.good());
        files_.push_back(p);
        return p;
    }
};

//------------------------------------------------

/** A file system held in memory

    Paths are stored verbatim. A path is a directory
    when some file path begins with it and a slash.
*/
class memory_file_system
    : public file_system
{
    struct entry
    {
        std::string body;
        boost::optional<std::int64_t> mtime;
    };

    std::map<std::string, entry> files_;
    bool positional_;

public:
    int reads = 0;

    // when set, returned by every stat or read
    system::error_code stat_error;
    system::error_code read_error;

    explicit
    memory_file_system(
        bool positional = true)
        : positional_(positional)
    {
    }

    void
    add(
        std::string path,
        std::string body,
        boost::optional<std::int64_t> mtime = {})
    {
        files_[std::move(path)] = entry{
            std::move(body), mtime };
    }

    file_info
    stat(
        core::string_view path,
        system::error_code& ec) override
    {
        file_info fi;
        if(stat_error.failed())
        {
            ec = stat_error;
            return fi;
        }
        std::string s(path);
        if(! s.empty() && s.back() == '/')
            s.pop_back();
        auto it = files_.find(s);
        if(it != files_.end())
        {
            fi.is_file = true;
            fi.size = it->second.body.size();
            fi.mtime = it->second.mtime;
            ec = {};
            return fi;
        }
        auto const prefix = s + "/";
        it = files_.lower_bound(prefix);
        if( it != files_.end() &&
            it->first.compare(0, prefix.size(), prefix) == 0)
        {
            fi.is_directory = true;
            ec = {};
            return fi;
        }
        ec = system::errc::make_error_code(
            system::errc::no_such_file_or_directory);
        return fi;
    }

    std::string
    read_all(
        core::string_view path,
        system::error_code& ec) override
    {
        ++reads;
        if(read_error.failed())
        {
            ec = read_error;
            return {};
        }
        auto it = files_.find(std::string(path));
        if(it == files_.end())
        {
            ec = system::errc::make_error_code(
                system::errc::no_such_file_or_directory);
            return {};
        }
        ec = {};
        return it->second.body;
    }

    std::string
    read_range(
        core::string_view path,
        std::uint64_t offset,
        std::uint64_t n,
        system::error_code& ec) override
    {
        if(! positional_)
        {
            ec = BOOST_TRYFILES_ERR(error::not_supported);
            return {};
        }
        auto s = read_all(path, ec);
        if(ec.failed())
            return {};
        if(offset >= s.size())
            return {};
        return s.substr(
            static_cast<std::size_t>(offset),
            static_cast<std::size_t>(n));
    }

    bool
    supports_positional_read() const noexcept override
    {
        return positional_;
    }
};

} // test
} // tryfiles
} // boost

#define TEST_SUITE(type, name) \
    static ::boost::tryfiles::test::suite_registrar \
        type##_registrar_( name, []{ type t; t.run(); })

#endif
