//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the progress trace.  Worker threads trace while scanning units
// in parallel, so each line is written under a mutex.
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace apicheck::support
{
namespace
{
std::atomic<int> gForced{-1};
std::atomic<std::ostream *> gStream{nullptr};
std::mutex gTraceMutex;

bool envEnabled()
{
    static const bool enabled = std::getenv("APICHECK_TRACE") != nullptr;
    return enabled;
}
} // namespace

bool traceEnabled()
{
    const int forced = gForced.load(std::memory_order_relaxed);
    if (forced >= 0)
        return forced != 0;
    return envEnabled();
}

void setTraceEnabled(bool enabled)
{
    gForced.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

void setTraceStream(std::ostream &os)
{
    gStream.store(&os);
}

void trace(std::string_view message)
{
    if (!traceEnabled())
        return;
    std::ostream *os = gStream.load();
    std::lock_guard<std::mutex> lock(gTraceMutex);
    (os ? *os : std::cerr) << "[apicheck] " << message << '\n';
}

} // namespace apicheck::support
