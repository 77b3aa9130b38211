//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Environment.hpp
// Purpose: Flat name-to-binding map with call frames that save and restore
//          the bindings a call shadows or introduces.
// Key invariants: After popFrame() the visible bindings equal those visible
//                 before the matching pushFrame(), except for assignments made
//                 to names the frame did not declare.
// Ownership/Lifetime: Owns its bindings; values share arrays and objects.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pulse::runtime
{

/// @brief Identifier of a registered heap object; 0 means "none".
using ObjectId = uint64_t;
inline constexpr ObjectId kNoObject = 0;

/// @brief A named value plus the heap object that accounts for it.
struct Binding
{
    Value value;
    ObjectId object = kNoObject;
    std::string typeName;  ///< Declared type; empty when untyped
    bool isArray = false;  ///< Declared as `T[]`
};

/// @brief Variables visible to the evaluator.
///
/// @details The environment is one ordered map. Method calls push a frame; the
/// first time a frame declares a name, the previous binding (or its absence)
/// is remembered and restored when the frame is popped. That keeps recursion
/// correct without nested lexical scopes. Names not redeclared by a frame stay
/// visible to it, so top-level variables behave as script globals.
class Environment
{
  public:
    /// @brief Declare (or redeclare) @p name in the innermost frame.
    void declare(const std::string &name, Binding binding);

    /// @brief Find the visible binding for @p name.
    Binding *lookup(const std::string &name);
    const Binding *lookup(const std::string &name) const;

    /// @brief True when @p name was declared by the innermost frame, or is
    ///        bound at all while no frame is active.
    [[nodiscard]] bool isLocal(const std::string &name) const;

    /// @brief Enter a call frame.
    void pushFrame();

    /// @brief Leave the innermost call frame, restoring shadowed bindings.
    void popFrame();

    /// @brief Number of active call frames.
    [[nodiscard]] size_t frameDepth() const
    {
        return frames_.size();
    }

    /// @brief Currently visible bindings in name order.
    const std::map<std::string, Binding> &bindings() const
    {
        return bindings_;
    }

    /// @brief Heap objects referenced by any visible or shadowed binding.
    std::set<ObjectId> roots() const;

    /// @brief Drop all bindings and frames.
    void clear();

  private:
    struct Frame
    {
        /// Previous binding per name declared in this frame (nullopt if none).
        std::vector<std::pair<std::string, std::optional<Binding>>> saved;
        std::set<std::string> declared;
    };

    std::map<std::string, Binding> bindings_;
    std::vector<Frame> frames_;
};

/// @brief RAII call frame: pushes on construction, pops on destruction.
class FrameGuard
{
  public:
    explicit FrameGuard(Environment &env) : env_(env)
    {
        env_.pushFrame();
    }

    ~FrameGuard()
    {
        env_.popFrame();
    }

    FrameGuard(const FrameGuard &) = delete;
    FrameGuard &operator=(const FrameGuard &) = delete;

  private:
    Environment &env_;
};

} // namespace pulse::runtime
