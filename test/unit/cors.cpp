//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/tryfiles/cors.hpp>

#include <boost/http_proto/request.hpp>
#include <boost/http_proto/response.hpp>
#include <stdexcept>

#include "test_helpers.hpp"

namespace boost {
namespace tryfiles {

struct cors_test
{
    using field = http::field;

    static
    http::request
    make_request(core::string_view origin)
    {
        http::request req;
        if(! origin.empty())
            req.set(field::origin, origin);
        return req;
    }

    void
    testDisabled()
    {
        cors_policy p;
        BOOST_TEST(p.get_kind() == cors_policy::kind::disabled);
        BOOST_TEST(cors_policy("").get_kind() ==
            cors_policy::kind::disabled);

        http::response res;
        p.apply(make_request("https://a.example"), res);
        BOOST_TEST(! res.exists(field::access_control_allow_origin));
        BOOST_TEST(! res.exists(field::access_control_allow_methods));
    }

    void
    testWildcard()
    {
        auto p = cors_policy::wildcard();
        BOOST_TEST(p.get_kind() == cors_policy::kind::wildcard);
        BOOST_TEST_EQ(p.source(), "*");
        BOOST_TEST(cors_policy("*").get_kind() ==
            cors_policy::kind::wildcard);

        // no origin needed
        http::response res;
        p.apply(make_request(""), res);
        BOOST_TEST_EQ(test::field_value(res,
            field::access_control_allow_origin), "*");
        BOOST_TEST_EQ(test::field_value(res,
            field::access_control_allow_methods), "OPTIONS,HEAD,GET");
        BOOST_TEST_EQ(test::field_value(res,
            field::access_control_allow_headers), "*");
        BOOST_TEST(! res.exists(
            field::access_control_allow_credentials));
    }

    void
    testPattern()
    {
        cors_policy p("^https://([a-z]+\\.)?example\\.com$");
        BOOST_TEST(p.get_kind() == cors_policy::kind::pattern);

        // matching origin is echoed
        {
            http::response res;
            p.apply(make_request("https://www.example.com"), res);
            BOOST_TEST_EQ(test::field_value(res,
                field::access_control_allow_origin),
                "https://www.example.com");
            BOOST_TEST_EQ(test::field_value(res,
                field::access_control_allow_methods),
                "OPTIONS,HEAD,GET,POST,PATCH,PUT,DELETE");
            BOOST_TEST_EQ(test::field_value(res,
                field::access_control_allow_credentials), "true");
            BOOST_TEST_EQ(test::field_value(res,
                field::access_control_max_age), "604800");
            auto const h = test::field_value(res,
                field::access_control_allow_headers);
            BOOST_TEST(h.find("If-Modified-Since") != std::string::npos);
            BOOST_TEST(h.find("Range") != std::string::npos);
        }

        // other origins get nothing
        {
            http::response res;
            p.apply(make_request("https://evil.test"), res);
            BOOST_TEST(! res.exists(field::access_control_allow_origin));
        }

        // no origin gets nothing
        {
            http::response res;
            p.apply(make_request(""), res);
            BOOST_TEST(! res.exists(field::access_control_allow_origin));
        }

        // the pattern is searched, not anchored
        {
            cors_policy p2("localhost");
            http::response res;
            p2.apply(make_request("http://localhost:3000"), res);
            BOOST_TEST_EQ(test::field_value(res,
                field::access_control_allow_origin),
                "http://localhost:3000");
        }
    }

    void
    testBadPattern()
    {
        BOOST_TEST_THROWS(cors_policy("(unclosed"),
            std::invalid_argument);
    }

    void
    run()
    {
        testDisabled();
        testWildcard();
        testPattern();
        testBadPattern();
    }
};

TEST_SUITE(
    cors_test,
    "boost.tryfiles.cors");

} // tryfiles
} // boost
