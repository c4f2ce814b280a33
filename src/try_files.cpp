//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/try_files.hpp>
#include <boost/http_proto/method.hpp>
#include <boost/http_proto/status.hpp>

namespace boost {
namespace tryfiles {

try_files::
try_files(
    server_config const& cfg,
    file_system& fs,
    fallback_handler fallback,
    log_sections& sections)
    : cors_(cfg.cors)
    , cache_(cfg.memory_cache ?
        new content_cache : nullptr)
    , resolver_(cfg, fs, cache_.get(),
        sections.get("try_files"))
    , fallback_(std::move(fallback))
{
    if(! fallback_)
        fallback_ = &not_found_handler;
}

void
try_files::
operator()(
    request const& req,
    reply& rep) const
{
    if(req.message.method() == http::method::options)
    {
        rep.message.set_status(http::status::no_content);
        rep.body.clear();
    }
    else if(! resolver_.resolve(req, rep))
    {
        fallback_(req, rep);
    }

    cors_.apply(req.message, rep.message);
}

} // tryfiles
} // boost
