//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Environment.cpp
// Purpose: Frame bookkeeping for the flat evaluator environment.
//
//===----------------------------------------------------------------------===//

#include "runtime/Environment.hpp"

namespace pulse::runtime
{

void Environment::declare(const std::string &name, Binding binding)
{
    if (!frames_.empty())
    {
        Frame &frame = frames_.back();
        if (frame.declared.insert(name).second)
        {
            auto it = bindings_.find(name);
            if (it != bindings_.end())
                frame.saved.emplace_back(name, it->second);
            else
                frame.saved.emplace_back(name, std::nullopt);
        }
    }
    bindings_[name] = std::move(binding);
}

Binding *Environment::lookup(const std::string &name)
{
    auto it = bindings_.find(name);
    return it == bindings_.end() ? nullptr : &it->second;
}

const Binding *Environment::lookup(const std::string &name) const
{
    auto it = bindings_.find(name);
    return it == bindings_.end() ? nullptr : &it->second;
}

bool Environment::isLocal(const std::string &name) const
{
    if (frames_.empty())
        return bindings_.count(name) != 0;
    return frames_.back().declared.count(name) != 0;
}

void Environment::pushFrame()
{
    frames_.emplace_back();
}

void Environment::popFrame()
{
    if (frames_.empty())
        return;
    Frame frame = std::move(frames_.back());
    frames_.pop_back();
    for (auto it = frame.saved.rbegin(); it != frame.saved.rend(); ++it)
    {
        if (it->second)
            bindings_[it->first] = std::move(*it->second);
        else
            bindings_.erase(it->first);
    }
}

std::set<ObjectId> Environment::roots() const
{
    std::set<ObjectId> ids;
    for (const auto &[name, binding] : bindings_)
    {
        if (binding.object != kNoObject)
            ids.insert(binding.object);
    }
    for (const auto &frame : frames_)
    {
        for (const auto &[name, saved] : frame.saved)
        {
            if (saved && saved->object != kNoObject)
                ids.insert(saved->object);
        }
    }
    return ids;
}

void Environment::clear()
{
    bindings_.clear();
    frames_.clear();
}

} // namespace pulse::runtime
