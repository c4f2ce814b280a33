//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_SERVER_TRY_FILES_SERVER_HPP
#define BOOST_TRYFILES_SERVER_TRY_FILES_SERVER_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/application.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/tryfiles/server_config.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace boost {
namespace tryfiles {

class try_files;

/** A static file server as an application part

    When started, the server accepts connections on the
    configured address and port. Each request is answered
    by a file from the files directory, or by the fallback
    handler. When stopped, the `before_close` hook is
    invoked once, the listening socket is closed, and
    idle connections are cancelled.
*/
class BOOST_SYMBOL_VISIBLE
    try_files_server
    : public application::part
{
public:
    BOOST_TRYFILES_DECL
    ~try_files_server();

    /** Run the server

        This function attaches the current thread to I/O context
        so that it may be used for executing submitted function
        objects. Blocks the calling thread until the part is stopped
        and has no outstanding work.
    */
    virtual void attach() = 0;

    /** Return the endpoint the server is listening on
    */
    virtual
    asio::ip::tcp::endpoint
    local_endpoint() const = 0;

    /** Return the request dispatcher
    */
    virtual
    try_files const&
    dispatcher() const noexcept = 0;
};

/** Install a static file server and its I/O context

    The listening socket is bound before this function
    returns. The parser and serializer services are
    installed into @ref application::services, and the
    log threshold is set from the configuration.

    @param app The application to install into.

    @param cfg The server settings.

    @param fallback The handler for requests which match
    no file. If empty, @ref not_found_handler is used.

    @throws system::system_error if the address cannot be
    parsed or bound.
*/
BOOST_TRYFILES_DECL
auto
install_try_files_server(
    application& app,
    server_config cfg,
    fallback_handler fallback = {}) ->
        try_files_server&;

} // tryfiles
} // boost

#endif
