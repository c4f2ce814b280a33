//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_READ_HPP
#define BOOST_TRYFILES_READ_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/http_proto/parser.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace tryfiles {

/** Read a complete message from the stream.

    This function is used to asynchronously read a complete
    message from a stream into an instance of parser.
    The function call always returns immediately. The
    asynchronous operation will continue until one of the
    following conditions is true:

    @li The parser reads the entire message.

    @li An error occurs.

    This operation is implemented in terms of zero or more
    calls to the stream's `async_read_some` function, and is
    known as a <em>composed operation</em>. The program must
    ensure that the stream performs no other reads until
    this operation completes.

    @param s The stream from which the data is to be
    read. The type must meet the <em>AsyncReadStream</em>
    requirements.

    @param pr The parser to use. The object must remain
    valid at least until the handler is called; ownership is
    not transferred.

    @param token The completion token that will be used to
    produce a completion handler, which will be called when
    the read completes. The function signature of the
    completion handler must be:
    @code
    void handler(
        error_code const& error,        // result of operation
        std::size_t bytes_transferred   // the number of bytes consumed by the parser
    );
    @endcode

    @par Per-Operation Cancellation

    This asynchronous operation supports cancellation for
    the following `asio::cancellation_type` values:

    @li `asio::cancellation_type::terminal`
    @li `asio::cancellation_type::partial`
    @li `asio::cancellation_type::total`

    if they are also supported by the AsyncReadStream type's
    async_read_some operation.
*/
template<
    class AsyncReadStream,
    BOOST_ASIO_COMPLETION_TOKEN_FOR(
        void(system::error_code, std::size_t)) CompletionToken
            BOOST_ASIO_DEFAULT_COMPLETION_TOKEN_TYPE(
                typename AsyncReadStream::executor_type)>
BOOST_ASIO_INITFN_AUTO_RESULT_TYPE(CompletionToken,
    void (system::error_code, std::size_t))
async_read(
    AsyncReadStream& s,
    http::parser& pr,
    CompletionToken&& token
        BOOST_ASIO_DEFAULT_COMPLETION_TOKEN(
            typename AsyncReadStream::executor_type));

} // tryfiles
} // boost

#include <boost/tryfiles/impl/read.hpp>

#endif
