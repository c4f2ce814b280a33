//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/tryfiles/content_cache.hpp>

#include <thread>
#include <vector>

#include "test_helpers.hpp"

namespace boost {
namespace tryfiles {

struct content_cache_test
{
    static
    content_cache::value_type
    make(std::string s)
    {
        return std::make_shared<
            std::string const>(std::move(s));
    }

    void
    testFindInsert()
    {
        content_cache c;
        BOOST_TEST_EQ(c.size(), 0u);
        BOOST_TEST(! c.find("/a.txt", ""));

        c.insert("/a.txt", "", make("hello"));
        BOOST_TEST_EQ(c.size(), 1u);
        auto v = c.find("/a.txt", "");
        if(BOOST_TEST(v))
            BOOST_TEST_EQ(*v, "hello");

        // a different version misses
        BOOST_TEST(! c.find("/a.txt", "?v=2"));

        // a new version replaces the entry
        c.insert("/a.txt", "?v=2", make("world"));
        BOOST_TEST_EQ(c.size(), 1u);
        BOOST_TEST(! c.find("/a.txt", ""));
        v = c.find("/a.txt", "?v=2");
        if(BOOST_TEST(v))
            BOOST_TEST_EQ(*v, "world");

        // returned bytes outlive replacement
        c.insert("/a.txt", "?v=3", make("again"));
        BOOST_TEST_EQ(*v, "world");

        c.insert("/b.txt", "", make(""));
        BOOST_TEST_EQ(c.size(), 2u);
        BOOST_TEST(c.find("/b.txt", ""));
    }

    void
    testConcurrent()
    {
        content_cache c;
        std::vector<std::thread> vt;
        for(int i = 0; i < 4; ++i)
        {
            vt.emplace_back(
                [&c, i]
                {
                    for(int j = 0; j < 1000; ++j)
                    {
                        auto const path =
                            "/" + std::to_string(j % 10);
                        if(! c.find(path, ""))
                            c.insert(path, "",
                                make(std::to_string(i)));
                    }
                });
        }
        for(auto& t : vt)
            t.join();
        BOOST_TEST_EQ(c.size(), 10u);
    }

    void
    run()
    {
        testFindInsert();
        testConcurrent();
    }
};

TEST_SUITE(
    content_cache_test,
    "boost.tryfiles.content_cache");

} // tryfiles
} // boost
