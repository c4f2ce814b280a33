//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_WRITE_HPP
#define BOOST_TRYFILES_WRITE_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/http_proto/serializer.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace tryfiles {

/** Write a complete message to the stream.

    The serializer must have been started with a
    message. The operation continues until one of the
    following conditions is true:

    @li The serializer is done.

    @li An error occurs.

    This operation is implemented in terms of zero or more
    calls to the stream's `async_write_some` function. The
    program must ensure that the stream performs no other
    writes until this operation completes.

    @param s The stream to write to. The type must meet the
    <em>AsyncWriteStream</em> requirements.

    @param sr The serializer to use. The object must remain
    valid at least until the handler is called.

    @param token The completion token. The function signature
    of the completion handler must be:
    @code
    void handler(
        error_code const& error,        // result of operation
        std::size_t bytes_transferred   // the number of bytes written
    );
    @endcode
*/
template<
    class AsyncWriteStream,
    BOOST_ASIO_COMPLETION_TOKEN_FOR(
        void(system::error_code, std::size_t)) CompletionToken
            BOOST_ASIO_DEFAULT_COMPLETION_TOKEN_TYPE(
                typename AsyncWriteStream::executor_type)>
BOOST_ASIO_INITFN_AUTO_RESULT_TYPE(CompletionToken,
    void (system::error_code, std::size_t))
async_write(
    AsyncWriteStream& s,
    http::serializer& sr,
    CompletionToken&& token
        BOOST_ASIO_DEFAULT_COMPLETION_TOKEN(
            typename AsyncWriteStream::executor_type));

} // tryfiles
} // boost

#include <boost/tryfiles/impl/write.hpp>

#endif
