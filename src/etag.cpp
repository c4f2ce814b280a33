//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/etag.hpp>
#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/detail/base64.hpp>
#include <openssl/sha.h>

namespace boost {
namespace tryfiles {

namespace {

void
append_hex(
    std::string& dest,
    std::uint64_t v)
{
    static char constexpr digits[] = "0123456789abcdef";
    char buf[16];
    char* p = buf + sizeof(buf);
    do
    {
        *--p = digits[v & 0xf];
        v >>= 4;
    }
    while(v != 0);
    dest.append(p, buf + sizeof(buf));
}

std::string
finish(
    std::string tag,
    bool weak)
{
    if(! weak)
        return tag;
    return "W/" + tag;
}

} // (anon)

std::string
make_etag(
    file_info const& info,
    bool weak)
{
    std::string s;
    s.push_back('"');
    append_hex(s, info.size);
    s.push_back('-');
    // negative times are written as 0
    if( info.mtime &&
        *info.mtime > 0)
        append_hex(s, static_cast<
            std::uint64_t>(*info.mtime));
    else
        s.push_back('0');
    s.push_back('"');
    return finish(std::move(s), weak);
}

std::string
make_etag(
    core::string_view body,
    bool weak)
{
    if(body.empty())
        return finish("\"0-2jmj7l5rSw0yVb/vlWAYkK/YBwk=\"", weak);

    unsigned char digest[SHA_DIGEST_LENGTH];
    ::SHA1(
        reinterpret_cast<unsigned char const*>(body.data()),
        body.size(),
        digest);

    std::string hash;
    detail::base64_encode(hash, digest, sizeof(digest));
    hash.resize(27);

    std::string s;
    s.push_back('"');
    append_hex(s, body.size());
    s.push_back('-');
    s.append(hash);
    s.push_back('"');
    return finish(std::move(s), weak);
}

} // tryfiles
} // boost
