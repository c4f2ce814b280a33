//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_SERVER_CONFIG_HPP
#define BOOST_TRYFILES_SERVER_CONFIG_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/cors.hpp>
#include <boost/tryfiles/logger.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace boost {
namespace tryfiles {

/** Settings for a try-files server

    The settings are copied when the server is
    installed and do not change afterwards.
*/
struct server_config
{
    /// The address to listen on
    std::string address = "0.0.0.0";

    /// The port to listen on
    unsigned short port = 8080;

    /// The directory from which files are served
    std::string files_dir = "public";

    /// The file served when a directory is requested
    std::string index_name = "index.html";

    /// The cross-origin policy applied to every response
    cors_policy cors;

    /// If true, file contents are cached in memory
    bool memory_cache = false;

    /** The most bytes returned for an open-ended range

        A request for `bytes=N-` receives at
        most this many bytes. Must not be zero.
    */
    std::uint64_t byte_range_chunk = 262144;

    /** Invoked once when the server begins shutting down
    */
    std::function<void()> before_close;

    /// The number of threads running the I/O context
    unsigned io_threads = 1;

    /// The number of threads for file access and the fallback handler
    unsigned work_threads = 4;

    /// The most connections served at once
    std::size_t max_connections = 64;

    /// Messages below this level are not logged
    log_level level = log_level::info;
};

} // tryfiles
} // boost

#endif
