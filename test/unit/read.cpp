//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/tryfiles/read.hpp>

#include <boost/http_proto/request_parser.hpp>
#include <boost/rts/context.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace tryfiles {

struct read_test
{
    using socket_type = asio::ip::tcp::socket;

    asio::io_context ioc_;
    rts::context ctx_;

    read_test()
    {
        http::install_parser_service(ctx_,
            http::request_parser::config());
    }

    void
    send(socket_type& s, core::string_view text)
    {
        asio::write(s, asio::buffer(text.data(), text.size()));
    }

    void
    testComplete()
    {
        socket_type s1(ioc_);
        socket_type s2(ioc_);
        if(! BOOST_TEST(test::connect(ioc_, s1, s2)))
            return;

        core::string_view const msg =
            "POST /upload HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Length: 5\r\n"
            "\r\n"
            "hello";
        send(s1, msg);

        http::request_parser pr(ctx_);
        pr.reset();
        pr.start();
        bool invoked = false;
        async_read(s2, pr,
            [&](system::error_code ec, std::size_t n)
            {
                invoked = true;
                BOOST_TEST(! ec.failed());
                BOOST_TEST_EQ(n, msg.size());
            });
        test::run(ioc_);
        BOOST_TEST(invoked);
        BOOST_TEST(pr.is_complete());
        BOOST_TEST_EQ(pr.get().target(), "/upload");
        BOOST_TEST_EQ(pr.body(), "hello");
    }

    void
    testPipelined()
    {
        socket_type s1(ioc_);
        socket_type s2(ioc_);
        if(! BOOST_TEST(test::connect(ioc_, s1, s2)))
            return;

        send(s1,
            "GET /one HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "\r\n"
            "GET /two HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "\r\n");

        http::request_parser pr(ctx_);
        pr.reset();

        pr.start();
        async_read(s2, pr,
            [](system::error_code ec, std::size_t)
            {
                BOOST_TEST(! ec.failed());
            });
        test::run(ioc_);
        BOOST_TEST(pr.is_complete());
        BOOST_TEST_EQ(pr.get().target(), "/one");

        // the second message is already buffered
        pr.start();
        bool invoked = false;
        async_read(s2, pr,
            [&](system::error_code ec, std::size_t n)
            {
                invoked = true;
                BOOST_TEST(! ec.failed());
                BOOST_TEST_EQ(n, 0u);
            });
        BOOST_TEST(! invoked);
        test::run(ioc_);
        BOOST_TEST(invoked);
        BOOST_TEST(pr.is_complete());
        BOOST_TEST_EQ(pr.get().target(), "/two");
    }

    void
    testEndOfStream()
    {
        // peer closes before sending anything
        {
            socket_type s1(ioc_);
            socket_type s2(ioc_);
            if(! BOOST_TEST(test::connect(ioc_, s1, s2)))
                return;
            s1.shutdown(socket_type::shutdown_send);

            http::request_parser pr(ctx_);
            pr.reset();
            pr.start();
            bool invoked = false;
            async_read(s2, pr,
                [&](system::error_code ec, std::size_t n)
                {
                    invoked = true;
                    BOOST_TEST(ec.failed());
                    BOOST_TEST_EQ(n, 0u);
                });
            test::run(ioc_);
            BOOST_TEST(invoked);
            BOOST_TEST(! pr.is_complete());
        }

        // peer closes in the middle of a message
        {
            socket_type s1(ioc_);
            socket_type s2(ioc_);
            if(! BOOST_TEST(test::connect(ioc_, s1, s2)))
                return;
            send(s1,
                "GET / HTTP/1.1\r\n"
                "Host: loc");
            s1.shutdown(socket_type::shutdown_send);

            http::request_parser pr(ctx_);
            pr.reset();
            pr.start();
            bool invoked = false;
            async_read(s2, pr,
                [&](system::error_code ec, std::size_t)
                {
                    invoked = true;
                    BOOST_TEST(ec.failed());
                });
            test::run(ioc_);
            BOOST_TEST(invoked);
        }
    }

    void
    testBadRequest()
    {
        socket_type s1(ioc_);
        socket_type s2(ioc_);
        if(! BOOST_TEST(test::connect(ioc_, s1, s2)))
            return;
        send(s1, "NOT A REQUEST\r\n\r\n");

        http::request_parser pr(ctx_);
        pr.reset();
        pr.start();
        bool invoked = false;
        async_read(s2, pr,
            [&](system::error_code ec, std::size_t)
            {
                invoked = true;
                BOOST_TEST(ec.failed());
            });
        test::run(ioc_);
        BOOST_TEST(invoked);
    }

    void
    testCancel()
    {
        socket_type s1(ioc_);
        socket_type s2(ioc_);
        if(! BOOST_TEST(test::connect(ioc_, s1, s2)))
            return;

        http::request_parser pr(ctx_);
        pr.reset();
        pr.start();
        bool invoked = false;
        async_read(s2, pr,
            [&](system::error_code ec, std::size_t n)
            {
                invoked = true;
                BOOST_TEST_EQ(ec, asio::error::operation_aborted);
                BOOST_TEST_EQ(n, 0u);
            });
        ioc_.poll();
        ioc_.restart();
        s2.cancel();
        test::run(ioc_);
        BOOST_TEST(invoked);
    }

    void
    run()
    {
        testComplete();
        testPipelined();
        testEndOfStream();
        testBadRequest();
        testCancel();
    }
};

TEST_SUITE(
    read_test,
    "boost.tryfiles.read");

} // tryfiles
} // boost
