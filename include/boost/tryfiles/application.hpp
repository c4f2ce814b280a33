//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_APPLICATION_HPP
#define BOOST_TRYFILES_APPLICATION_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/rts/context.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

namespace boost {
namespace tryfiles {

/** The process-wide state of a server program

    A program installs its parts, typically an
    @ref asio_io_context followed by a @ref try_files_server,
    then calls @ref start once. A signal or the program
    itself calls @ref stop, which reaches every started
    part exactly once, newest first.

    The application also owns the services shared by every
    HTTP parser and serializer, and the log sections.
*/
class BOOST_SYMBOL_VISIBLE
    application
{
public:
    /** A component whose lifetime is managed by the application

        The constructor of a part receives the application as
        its first argument. Constructors may throw; a part whose
        constructor throws is never installed.
    */
    class BOOST_SYMBOL_VISIBLE
        part
    {
    public:
        BOOST_TRYFILES_DECL
        virtual ~part();

        /// Begin operation. May throw to abort the start.
        virtual void start() = 0;

        /** End operation

            Called at most once, and only after `start`
            returned normally. May be called from any thread.
        */
        virtual void stop() = 0;
    };

    application(application const&) = delete;
    application& operator=(application const&) = delete;

    BOOST_TRYFILES_DECL
    application();

    /// Parts are destroyed newest first
    BOOST_TRYFILES_DECL
    ~application();

    /** Construct and install a part

        @return A reference to the new part.
    */
    template<class Part, class... Args>
    Part&
    emplace(Args&&... args)
    {
        static_assert(
            std::is_convertible<Part*, part*>::value,
            "Part must derive from application::part");
        std::unique_ptr<Part> p(new Part(
            *this, std::forward<Args>(args)...));
        Part& ref = *p;
        parts_.emplace_back(std::move(p));
        return ref;
    }

    /** Start each part in installation order

        If a part throws, the parts already started are
        stopped and the exception propagates.

        @throws std::logic_error if called twice, or
        after @ref stop.
    */
    BOOST_TRYFILES_DECL
    void
    start();

    /** Stop each started part, newest first

        Only the first call has an effect. A part which
        finishes starting after this call is stopped
        at once.

        @par Thread Safety
        May be called concurrently.
    */
    BOOST_TRYFILES_DECL
    void
    stop();

    rts::context&
    services() noexcept
    {
        return services_;
    }

    log_sections&
    sections() noexcept
    {
        return sections_;
    }

private:
    log_sections sections_;
    rts::context services_;
    std::vector<std::unique_ptr<part>> parts_;

    std::mutex m_;
    std::size_t started_ = 0;
    bool starting_ = false;
    bool stopped_ = false;
};

} // tryfiles
} // boost

#endif
