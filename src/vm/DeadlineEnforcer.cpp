//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/DeadlineEnforcer.cpp
// Purpose: Deadline bookkeeping and severity classification.
//
//===----------------------------------------------------------------------===//

#include "vm/DeadlineEnforcer.hpp"

#include "runtime/Heap.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace pulse::vm
{

namespace
{

double steadyNowMs()
{
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

DeadlineEnforcer::DeadlineEnforcer(Clock clock)
{
    setClock(std::move(clock));
}

void DeadlineEnforcer::setClock(Clock clock)
{
    clock_ = clock ? std::move(clock) : Clock(&steadyNowMs);
}

void DeadlineEnforcer::registerDeadline(const std::string &methodName,
                                        double deadlineMs,
                                        uint32_t line)
{
    registrations_[methodName] = Registration{deadlineMs, line};
}

bool DeadlineEnforcer::hasDeadline(const std::string &methodName) const
{
    return registrations_.count(methodName) != 0;
}

void DeadlineEnforcer::startMethod(const std::string &methodName)
{
    auto it = registrations_.find(methodName);
    if (it == registrations_.end())
        return;
    active_.push_back(Active{methodName, clock_(), it->second.deadlineMs, it->second.line});
}

std::optional<DeadlineViolation> DeadlineEnforcer::endMethod(const std::string &methodName)
{
    auto it = std::find_if(active_.rbegin(),
                           active_.rend(),
                           [&](const Active &a) { return a.methodName == methodName; });
    if (it == active_.rend())
        return std::nullopt;

    const Active entry = *it;
    active_.erase(std::next(it).base());

    const double actualMs = clock_() - entry.startMs;
    if (actualMs <= entry.deadlineMs)
        return std::nullopt;

    DeadlineViolation violation;
    violation.methodName = entry.methodName;
    violation.expectedMs = entry.deadlineMs;
    violation.actualMs = actualMs;
    violation.line = entry.line;
    violation.severity = actualMs > 2.0 * entry.deadlineMs ? DeadlineSeverity::Critical
                                                           : DeadlineSeverity::Warning;
    violation.timestamp = runtime::wallClockMs();
    violations_.push_back(violation);
    return violation;
}

void DeadlineEnforcer::clearViolations()
{
    violations_.clear();
}

std::vector<ActiveDeadline> DeadlineEnforcer::activeDeadlines() const
{
    const double now = clock_();
    std::vector<ActiveDeadline> out;
    out.reserve(active_.size());
    for (const auto &a : active_)
        out.push_back(ActiveDeadline{a.methodName, std::max(0.0, a.deadlineMs - (now - a.startMs))});
    return out;
}

void DeadlineEnforcer::reset()
{
    registrations_.clear();
    active_.clear();
    violations_.clear();
}

} // namespace pulse::vm
