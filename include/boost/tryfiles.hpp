//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_HPP
#define BOOST_TRYFILES_HPP

#include <boost/tryfiles/application.hpp>
#include <boost/tryfiles/asio_io_context.hpp>
#include <boost/tryfiles/content_cache.hpp>
#include <boost/tryfiles/cors.hpp>
#include <boost/tryfiles/error.hpp>
#include <boost/tryfiles/etag.hpp>
#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/http_date.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/tryfiles/mime_types.hpp>
#include <boost/tryfiles/read.hpp>
#include <boost/tryfiles/server_config.hpp>
#include <boost/tryfiles/static_resolver.hpp>
#include <boost/tryfiles/try_files.hpp>
#include <boost/tryfiles/write.hpp>
#include <boost/tryfiles/server/try_files_server.hpp>

#endif
