//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_IMPL_WRITE_HPP
#define BOOST_TRYFILES_IMPL_WRITE_HPP

#include <boost/http_proto/error.hpp>
#include <boost/http_proto/serializer.hpp>
#include <boost/asio/append.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/coroutine.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/immediate.hpp>
#include <vector>

namespace boost {
namespace tryfiles {

namespace detail {

template<class AsyncStream>
class write_op
    : public asio::coroutine
{
    AsyncStream& stream_;
    http::serializer& sr_;
    std::vector<asio::const_buffer> bufs_;
    std::size_t total_bytes_ = 0;

public:
    write_op(
        AsyncStream& s,
        http::serializer& sr) noexcept
        : stream_(s)
        , sr_(sr)
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

            while(! sr_.is_done())
            {
                {
                    auto rv = sr_.prepare();
                    if(rv.has_error())
                    {
                        ec = rv.error();
                    }
                    else
                    {
                        bufs_.clear();
                        for(auto const& b : *rv)
                            bufs_.emplace_back(b.data(), b.size());
                    }
                }
                if(ec.failed())
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
                if(!! self.cancelled())
                {
                    ec = asio::error::operation_aborted;
                    goto upcall;
                }
                BOOST_ASIO_CORO_YIELD
                {
                    BOOST_ASIO_HANDLER_LOCATION((
                        __FILE__, __LINE__,
                        "async_write_some"));
                    stream_.async_write_some(
                        bufs_, std::move(self));
                }
                sr_.consume(bytes_transferred);
                total_bytes_ += bytes_transferred;
                if(ec.failed())
                    goto upcall;
            }

        upcall:
            self.complete(ec, total_bytes_);
        }
    }
};

} // detail

//------------------------------------------------

template<
    class AsyncWriteStream,
    BOOST_ASIO_COMPLETION_TOKEN_FOR(
        void(system::error_code, std::size_t)) CompletionToken>
BOOST_ASIO_INITFN_AUTO_RESULT_TYPE(CompletionToken,
    void (system::error_code, std::size_t))
async_write(
    AsyncWriteStream& s,
    http::serializer& sr,
    CompletionToken&& token)
{
    return asio::async_compose<
        CompletionToken,
        void(system::error_code, std::size_t)>(
            detail::write_op<AsyncWriteStream>{s, sr},
            token,
            s);
}

} // tryfiles
} // boost

#endif
