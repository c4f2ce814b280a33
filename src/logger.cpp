//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/logger.hpp>
#include <atomic>
#include <chrono>
#include <climits>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace boost {
namespace tryfiles {

core::string_view
to_string(log_level level) noexcept
{
    switch(level)
    {
    case log_level::trace:   return "TRC";
    case log_level::debug:   return "DBG";
    case log_level::info:    return "INF";
    case log_level::warning: return "WRN";
    case log_level::error:   return "ERR";
    case log_level::fatal:   return "FTL";
    default:
        return "???";
    }
}

namespace {

// "2026-01-31T23:59:59.123Z"
std::string
make_timestamp()
{
    using namespace std::chrono;
    auto const now = system_clock::now();
    auto const ms = duration_cast<milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm_utc{};
#if defined(_WIN32)
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif
    char buf[32];
    std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_utc.tm_year + 1900,
        tm_utc.tm_mon + 1,
        tm_utc.tm_mday,
        tm_utc.tm_hour,
        tm_utc.tm_min,
        tm_utc.tm_sec,
        static_cast<int>(ms));
    return std::string(buf);
}

} // (anon)

//------------------------------------------------

// state shared by every section of one collection
struct section::shared
{
    std::mutex m;
    std::ostream* os = &std::cerr;
    std::atomic<int> level{static_cast<int>(log_level::info)};
};

struct section::impl
{
    std::string name;
    std::shared_ptr<shared> sp;
};

section::
section() noexcept = default;

section::
section(std::shared_ptr<impl> sp) noexcept
    : impl_(std::move(sp))
{
}

int
section::
threshold() const noexcept
{
    if(! impl_)
        return INT_MAX;
    return impl_->sp->level.load(
        std::memory_order_relaxed);
}

core::string_view
section::
name() const noexcept
{
    if(! impl_)
        return {};
    return impl_->name;
}

void
section::
write(
    int level,
    core::string_view s) const
{
    if(! impl_)
        return;
    std::string line = make_timestamp();
    line.push_back(' ');
    auto const lv = to_string(static_cast<log_level>(level));
    line.append(lv.data(), lv.size());
    line.push_back(' ');
    line.append(impl_->name);
    line.push_back(' ');
    line.append(s.data(), s.size());
    line.push_back('\n');

    auto& sh = *impl_->sp;
    std::lock_guard<std::mutex> lock(sh.m);
    sh.os->write(line.data(),
        static_cast<std::streamsize>(line.size()));
    sh.os->flush();
}

//------------------------------------------------

struct log_sections::impl
{
    struct hash
    {
        std::size_t
        operator()(core::string_view const& s) const noexcept
        {
        #if SIZE_MAX == 4294967295U
            std::size_t hash = 2166136261; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 16777619;   // FNV prime
        #else
            std::size_t hash = 1469598103934665603; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 1099511628211;   // FNV prime
        #endif
            return hash;
        }
    };

    mutable std::mutex m;
    std::shared_ptr<section::shared> sp =
        std::make_shared<section::shared>();
    std::unordered_map<core::string_view, section, hash> map;
};

log_sections::
~log_sections()
{
    delete impl_;
}

log_sections::
log_sections()
    : impl_(new impl)
{
}

section
log_sections::
get(core::string_view name)
{
    // sections are mostly created at startup
    std::lock_guard<std::mutex> lock(impl_->m);
    auto it = impl_->map.find(name);
    if(it != impl_->map.end())
        return it->second;
    auto sp = std::make_shared<section::impl>();
    sp->name = std::string(name);
    sp->sp = impl_->sp;
    // the key views the name owned by the section
    section v(sp);
    impl_->map.emplace(
        core::string_view(sp->name), v);
    return v;
}

void
log_sections::
set_threshold(int level) noexcept
{
    impl_->sp->level.store(
        level, std::memory_order_relaxed);
}

void
log_sections::
set_output(std::ostream& os)
{
    std::lock_guard<std::mutex> lock(impl_->sp->m);
    impl_->sp->os = &os;
}

} // tryfiles
} // boost
