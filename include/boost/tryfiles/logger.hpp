//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_LOGGER_HPP
#define BOOST_TRYFILES_LOGGER_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <iosfwd>
#include <memory>
#include <sstream>
#include <string>

namespace boost {
namespace tryfiles {

/** Logging levels

    Messages below a section's threshold are squelched.
*/
enum class log_level : int
{
    trace = 0,
    debug,
    info,
    warning,
    error,
    fatal
};

/** Return the short name of a level, such as "INF"
*/
BOOST_TRYFILES_DECL
core::string_view
to_string(log_level level) noexcept;

namespace detail {

// Writes `fs` to `os`, replacing each "{}"
// with the next argument in order.
class format_state
{
    std::ostream& os_;
    char const* p_;
    char const* end_;

    bool
    copy_to_placeholder()
    {
        auto p0 = p_;
        while(p_ != end_)
        {
            if( *p_ == '{' &&
                p_ + 1 != end_ &&
                p_[1] == '}')
            {
                os_.write(p0, p_ - p0);
                p_ += 2;
                return true;
            }
            ++p_;
        }
        os_.write(p0, p_ - p0);
        return false;
    }

public:
    format_state(
        std::ostream& os,
        core::string_view fs) noexcept
        : os_(os)
        , p_(fs.data())
        , end_(fs.data() + fs.size())
    {
    }

    template<class Arg>
    void
    arg(Arg const& a)
    {
        // extra arguments are dropped
        if(copy_to_placeholder())
            os_ << a;
    }

    void
    finish()
    {
        // unmatched placeholders are written as-is
        os_.write(p_, end_ - p_);
        p_ = end_;
    }
};

} // detail

/** Format arguments into a string using "{}" placeholders

    Each argument is written with `operator<<`.
*/
template<class... Args>
void
format_to(
    std::string& dest,
    core::string_view fs,
    Args const&... args)
{
    std::ostringstream os;
    detail::format_state st(os, fs);
    using expander = int[];
    (void)expander{0, (st.arg(args), 0)...};
    st.finish();
    dest.append(os.str());
}

//------------------------------------------------

/** A named log section

    Sections are obtained from @ref log_sections.
    Copies refer to the same section.
*/
class section
{
public:
    /** An in-flight log record at a given level
    */
    class record
    {
    public:
        template<class... Args>
        void
        operator()(
            core::string_view fs,
            Args const&... args) const
        {
            std::string s;
            format_to(s, fs, args...);
            sect_.write(level_, s);
        }

    private:
        friend class section;

        record(
            section const& sect,
            int level) noexcept
            : sect_(sect)
            , level_(level)
        {
        }

        section const& sect_;
        int level_;
    };

    /** Constructor

        A default-constructed section discards everything.
    */
    BOOST_TRYFILES_DECL
    section() noexcept;

    /** Return the level below which logging is squelched
    */
    BOOST_TRYFILES_DECL
    int
    threshold() const noexcept;

    /** Return the name of the section
    */
    BOOST_TRYFILES_DECL
    core::string_view
    name() const noexcept;

    /** Return a record which logs at the given level
    */
    record
    at(int level) const noexcept
    {
        return record(*this, level);
    }

private:
    friend class log_sections;

    struct shared;
    struct impl;

    BOOST_TRYFILES_DECL
    void
    write(int level, core::string_view s) const;

    explicit
    section(std::shared_ptr<impl> sp) noexcept;

    std::shared_ptr<impl> impl_;
};

//------------------------------------------------

/** A collection of named log sections

    All sections created from the same collection
    share its output stream and threshold.
*/
class log_sections
{
public:
    BOOST_TRYFILES_DECL
    ~log_sections();

    /** Constructor

        Output goes to `std::cerr` at @ref log_level::info.
    */
    BOOST_TRYFILES_DECL
    log_sections();

    log_sections(log_sections const&) = delete;
    log_sections& operator=(log_sections const&) = delete;

    /** Return a log section by name.

        If the section does not already exist, it is created.
        The name is case sensitive.
    */
    BOOST_TRYFILES_DECL
    section
    get(core::string_view name);

    /** Set the threshold of every section, present and future
    */
    BOOST_TRYFILES_DECL
    void
    set_threshold(int level) noexcept;

    /** Redirect output

        The stream must outlive every section
        obtained from this collection.
    */
    BOOST_TRYFILES_DECL
    void
    set_output(std::ostream& os);

private:
    struct impl;
    impl* impl_;
};

//------------------------------------------------

#ifndef LOG_AT_LEVEL
#define LOG_AT_LEVEL(sect, level) \
    if(static_cast<int>(level) < (sect).threshold()) {} \
    else (sect).at(static_cast<int>(level))
#endif

/// Log at trace level
#ifndef LOG_TRC
#define LOG_TRC(sect) LOG_AT_LEVEL(sect, ::boost::tryfiles::log_level::trace)
#endif

/// Log at debug level
#ifndef LOG_DBG
#define LOG_DBG(sect) LOG_AT_LEVEL(sect, ::boost::tryfiles::log_level::debug)
#endif

/// Log at info level (normal)
#ifndef LOG_INF
#define LOG_INF(sect) LOG_AT_LEVEL(sect, ::boost::tryfiles::log_level::info)
#endif

/// Log at warning level
#ifndef LOG_WRN
#define LOG_WRN(sect) LOG_AT_LEVEL(sect, ::boost::tryfiles::log_level::warning)
#endif

/// Log at error level
#ifndef LOG_ERR
#define LOG_ERR(sect) LOG_AT_LEVEL(sect, ::boost::tryfiles::log_level::error)
#endif

/// Log at fatal level
#ifndef LOG_FTL
#define LOG_FTL(sect) LOG_AT_LEVEL(sect, ::boost::tryfiles::log_level::fatal)
#endif

} // tryfiles
} // boost

#endif
