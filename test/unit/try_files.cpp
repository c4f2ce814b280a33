//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/tryfiles/try_files.hpp>

#include <boost/http_proto/status.hpp>
#include <sstream>
#include <stdexcept>

#include "test_helpers.hpp"

namespace boost {
namespace tryfiles {

struct try_files_test
{
    using field = http::field;
    using method = http::method;
    using status = http::status;

    log_sections ls_;
    std::ostringstream log_;

    try_files_test()
    {
        ls_.set_output(log_);
    }

    void
    testOptions()
    {
        server_config cfg;
        cfg.cors = cors_policy::wildcard();
        test::memory_file_system fs;
        fs.add("public/a.txt", "abc", 1000);
        try_files tf(cfg, fs, {}, ls_);

        for(auto target : { "/a.txt", "/missing", "/" })
        {
            test::request_builder rb(method::options, target);
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST(rep.message.status() == status::no_content);
            BOOST_TEST(rep.body.empty());
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::access_control_allow_origin), "*");
            BOOST_TEST(! rep.message.exists(field::content_type));
            BOOST_TEST(! rep.message.exists(field::content_length));
        }
    }

    void
    testFallback()
    {
        server_config cfg;
        cfg.cors = cors_policy("example");
        test::memory_file_system fs;

        // the default answers 404
        {
            try_files tf(cfg, fs, {}, ls_);
            test::request_builder rb(method::get, "/missing");
            rb.set(field::origin, "https://example.com");
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST(rep.message.status() == status::not_found);
            BOOST_TEST_EQ(rep.body, "Not Found");
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::content_type), "text/plain; charset=UTF-8");
            // the fallback's reply carries CORS headers
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::access_control_allow_origin),
                "https://example.com");
        }

        // application handler
        {
            int calls = 0;
            try_files tf(cfg, fs,
                [&calls](request const& req, reply& rep)
                {
                    ++calls;
                    rep.message.set_status(status::ok);
                    rep.message.set(field::content_type,
                        "application/json");
                    rep.set_body("{\"path\":\"" +
                        req.url.path() + "\"}");
                }, ls_);
            test::request_builder rb(method::post, "/api/items");
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST_EQ(calls, 1);
            BOOST_TEST(rep.message.status() == status::ok);
            BOOST_TEST_EQ(rep.body, "{\"path\":\"/api/items\"}");
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::content_type), "application/json");
            // no origin, no CORS
            BOOST_TEST(! rep.message.exists(
                field::access_control_allow_origin));
        }

        // exceptions propagate
        {
            try_files tf(cfg, fs,
                [](request const&, reply&)
                {
                    throw std::runtime_error("boom");
                }, ls_);
            test::request_builder rb(method::get, "/missing");
            reply rep;
            BOOST_TEST_THROWS(tf(rb.get(), rep),
                std::runtime_error);
        }
    }

    void
    testResolved()
    {
        server_config cfg;
        cfg.cors = cors_policy::wildcard();
        test::memory_file_system fs;
        fs.add("public/a.txt", "abc", 1000);
        int calls = 0;
        try_files tf(cfg, fs,
            [&calls](request const&, reply&)
            {
                ++calls;
            }, ls_);
        BOOST_TEST(tf.cache() == nullptr);

        test::request_builder rb(method::get, "/a.txt");
        reply rep;
        tf(rb.get(), rep);
        BOOST_TEST_EQ(calls, 0);
        BOOST_TEST(rep.message.status() == status::ok);
        BOOST_TEST_EQ(rep.body, "abc");
        BOOST_TEST_EQ(test::field_value(rep.message,
            field::access_control_allow_origin), "*");
    }

    void
    testMemoryCache()
    {
        server_config cfg;
        cfg.memory_cache = true;
        test::memory_file_system fs;
        fs.add("public/a.txt", "abc", 1000);
        try_files tf(cfg, fs, {}, ls_);
        if(! BOOST_TEST(tf.cache() != nullptr))
            return;

        for(int i = 0; i < 3; ++i)
        {
            test::request_builder rb(method::get, "/a.txt?v=1");
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST_EQ(rep.body, "abc");
        }
        BOOST_TEST_EQ(fs.reads, 1);
        BOOST_TEST_EQ(tf.cache()->size(), 1u);
    }

    // public/index.html (10 bytes), public/a.txt (0 bytes),
    // on a file system which reports no modification time
    void
    testScenario()
    {
        server_config cfg;
        test::memory_file_system fs;
        fs.add("public/index.html", "<b>hi</b>\n");
        fs.add("public/a.txt", "");
        try_files tf(cfg, fs, {}, ls_);

        {
            test::request_builder rb(method::get, "/");
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST(rep.message.status() == status::ok);
            BOOST_TEST_EQ(rep.body.size(), 10u);
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::content_type), "text/html");
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::cache_control), "no-cache");
        }

        {
            test::request_builder rb(method::get, "/a.txt");
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST(rep.message.status() == status::ok);
            BOOST_TEST(rep.body.empty());
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::content_length), "0");
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::etag), "W/\"0-2jmj7l5rSw0yVb/vlWAYkK/YBwk=\"");
            BOOST_TEST_EQ(test::field_value(rep.message,
                field::cache_control), "public, max-age=31536000");
        }

        {
            test::request_builder rb(method::get, "/missing");
            reply rep;
            tf(rb.get(), rep);
            BOOST_TEST(rep.message.status() == status::not_found);
        }
    }

    void
    run()
    {
        testOptions();
        testFallback();
        testResolved();
        testMemoryCache();
        testScenario();
    }
};

TEST_SUITE(
    try_files_test,
    "boost.tryfiles.try_files");

} // tryfiles
} // boost
