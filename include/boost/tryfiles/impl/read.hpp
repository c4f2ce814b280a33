//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_IMPL_READ_HPP
#define BOOST_TRYFILES_IMPL_READ_HPP

#include <boost/http_proto/error.hpp>
#include <boost/http_proto/parser.hpp>
#include <boost/asio/append.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/coroutine.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/immediate.hpp>
#include <boost/assert.hpp>

namespace boost {
namespace tryfiles {

namespace detail {

template<class AsyncStream>
class read_op
    : public asio::coroutine
{
    AsyncStream& stream_;
    http::parser& pr_;
    std::size_t total_bytes_ = 0;

public:
    read_op(
        AsyncStream& s,
        http::parser& pr) noexcept
        : stream_(s)
        , pr_(pr)
    {
    }

    template<class Self>
    void
    operator()(
        Self& self,
        system::error_code ec = {},
        std::size_t bytes_transferred = 0)
    {
        BOOST_ASIO_CORO_REENTER(*this)
        {
            self.reset_cancellation_state(
                asio::enable_total_cancellation());

            for(;;)
            {
                for(;;)
                {
                    pr_.parse(ec);
                    if(ec == http::condition::need_more_input)
                    {
                        if(!!self.cancelled())
                        {
                            ec = asio::error::operation_aborted;
                            goto upcall;
                        }
                        break;
                    }
                    if(ec.failed() || pr_.is_complete())
                    {
                        if(total_bytes_ == 0)
                        {
                            BOOST_ASIO_CORO_YIELD
                            {
                                BOOST_ASIO_HANDLER_LOCATION((
                                    __FILE__, __LINE__,
                                    "immediate"));
                                auto io_ex = self.get_io_executor();
                                asio::async_immediate(
                                    io_ex,
                                    asio::append(std::move(self), ec));
                            }
                        }
                        goto upcall;
                    }
                }
                BOOST_ASIO_CORO_YIELD
                {
                    BOOST_ASIO_HANDLER_LOCATION((
                        __FILE__, __LINE__,
                        "async_read_some"));
                    stream_.async_read_some(
                        pr_.prepare(),
                        std::move(self));
                }
                pr_.commit(bytes_transferred);
                total_bytes_ += bytes_transferred;
                if(ec == asio::error::eof)
                {
                    BOOST_ASSERT(
                        bytes_transferred == 0);
                    pr_.commit_eof();
                    ec = {};
                }
                else if(ec.failed())
                {
                    goto upcall;
                }
            }

        upcall:
            self.complete(ec, total_bytes_);
        }
    }
};

} // detail

//------------------------------------------------

template<
    class AsyncReadStream,
    BOOST_ASIO_COMPLETION_TOKEN_FOR(
        void(system::error_code, std::size_t)) CompletionToken>
BOOST_ASIO_INITFN_AUTO_RESULT_TYPE(CompletionToken,
    void (system::error_code, std::size_t))
async_read(
    AsyncReadStream& s,
    http::parser& pr,
    CompletionToken&& token)
{
    return asio::async_compose<
        CompletionToken,
        void(system::error_code, std::size_t)>(
            detail::read_op<AsyncReadStream>{s, pr},
            token,
            s);
}

} // tryfiles
} // boost

#endif
