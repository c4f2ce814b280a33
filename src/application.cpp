//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/application.hpp>
#include <boost/tryfiles/detail/except.hpp>
#include <exception>

namespace boost {
namespace tryfiles {

application::part::~part() = default;

application::
application() = default;

application::
~application()
{
    // sections_ and services_ outlive every part
    while(! parts_.empty())
        parts_.pop_back();
}

void
application::
start()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        if(starting_ || stopped_)
            detail::throw_logic_error(
                "application::start: already started or stopped");
        starting_ = true;
    }

    for(auto& p : parts_)
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            if(stopped_)
                return;
        }

        try
        {
            p->start();
        }
        catch(std::exception const&)
        {
            stop();
            throw;
        }

        bool late;
        {
            std::lock_guard<std::mutex> lock(m_);
            late = stopped_;
            if(! late)
                ++started_;
        }
        if(late)
        {
            p->stop();
            return;
        }
    }
}

void
application::
stop()
{
    std::size_t n;
    {
        std::lock_guard<std::mutex> lock(m_);
        if(stopped_)
            return;
        stopped_ = true;
        n = started_;
    }
    while(n > 0)
        parts_[--n]->stop();
}

} // tryfiles
} // boost
