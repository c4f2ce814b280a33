//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/mime_types.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace boost {
namespace tryfiles {

namespace {

struct mime_entry
{
    char const* ext;
    char const* type;
};

mime_entry const mime_table[] = {
    // scripts and styles
    { "css",   "text/css" },
    { "js",    "text/javascript" },
    { "map",   "text/plain" },

    // text
    { "txt",   "text/plain" },
    { "htm",   "text/html" },
    { "html",  "text/html" },
    { "xml",   "text/xml" },
    { "ini",   "text/plain" },
    { "conf",  "text/plain" },
    { "yaml",  "text/yaml" },
    { "yml",   "text/yaml" },

    // images
    { "jpeg",  "image/jpeg" },
    { "jpg",   "image/jpeg" },
    { "bmp",   "image/bmp" },
    { "png",   "image/png" },
    { "apng",  "image/apng" },
    { "webp",  "image/webp" },
    { "avif",  "image/avif" },
    { "gif",   "image/gif" },
    { "ico",   "image/ico" },
    { "svg",   "image/svg+xml" },

    // audio
    { "mp3",   "audio/mp3" },
    { "wav",   "audio/wav" },
    { "ogg",   "audio/ogg" },
    { "aac",   "audio/x-aac" },
    { "m4a",   "audio/x-m4a" },
    { "aiff",  "audio/x-aiff" },
    { "flac",  "audio/x-flac" },
    { "weba",  "audio/webm" },
    { "midi",  "audio/midi" },

    // video
    { "mp4",   "video/mp4" },
    { "mpeg",  "video/mpeg" },
    { "mpg",   "video/mpeg" },
    { "webm",  "video/webm" },
    { "avi",   "video/x-msvideo" },
    { "3gp",   "video/3gpp" },
    { "mov",   "video/quicktime" },
    { "mkv",   "video/x-matroska" },
    { "flv",   "video/x-flv" },

    // fonts
    { "otf",   "font/otf" },
    { "ttf",   "font/ttf" },
    { "woff",  "font/woff" },
    { "woff2", "font/woff2" },

    // applications
    { "json",  "application/json" },
    { "pdf",   "application/pdf" },
    { "zip",   "application/zip" },
    { "gz",    "application/gzip" }
};

bool
is_word_char(char c) noexcept
{
    return
        (c >= 'a' && c <= 'z') ||
        (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9') ||
        c == '_';
}

} // (anon)

std::string
file_extension(
    core::string_view path)
{
    auto const pos = path.rfind('.');
    if( pos == core::string_view::npos ||
        pos == 0)
        return {};
    auto const ext = path.substr(pos + 1);
    if(ext.empty())
        return {};
    std::string s;
    s.reserve(ext.size());
    for(char c : ext)
    {
        if(! is_word_char(c))
            return {};
        s.push_back(urls::grammar::to_lower(c));
    }
    return s;
}

core::string_view
mime_type(
    core::string_view ext) noexcept
{
    using urls::grammar::ci_is_equal;
    for(auto const& e : mime_table)
        if(ci_is_equal(ext, e.ext))
            return e.type;
    return "application/octet-stream";
}

} // tryfiles
} // boost
