//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/detail/base64.hpp>

namespace boost {
namespace tryfiles {
namespace detail {

void
base64_encode(
    std::string& dest,
    void const* src,
    std::size_t n)
{
    auto in = static_cast<unsigned char const*>(src);
    static char constexpr tab[] = {
        "ABCDEFGHIJKLMNOP"
        "QRSTUVWXYZabcdef"
        "ghijklmnopqrstuv"
        "wxyz0123456789+/"
    };

    dest.reserve(dest.size() + 4 * ((n + 2) / 3));
    for(auto i = n / 3; i--;)
    {
        dest.append({
            tab[ (in[0] & 0xfc) >> 2],
            tab[((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4)],
            tab[((in[2] & 0xc0) >> 6) + ((in[1] & 0x0f) << 2)],
            tab[  in[2] & 0x3f] });
        in += 3;
    }

    switch(n % 3)
    {
    case 2:
        dest.append({
            tab[ (in[0] & 0xfc) >> 2],
            tab[((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4)],
            tab[                         (in[1] & 0x0f) << 2],
            '=' });
        break;

    case 1:
        dest.append({
            tab[ (in[0] & 0xfc) >> 2],
            tab[ (in[0] & 0x03) << 4],
            '=',
            '=' });
        break;

    case 0:
        break;
    }
}

} // detail
} // tryfiles
} // boost
