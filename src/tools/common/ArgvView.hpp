//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Non-owning cursor over argv-style argument arrays.
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace pulse::tools
{

/// @brief Non-owning view over the argument count and pointer pair supplied
///        by the C runtime.
struct ArgvView
{
    int argc;
    char **argv;

    /// @brief True when no arguments remain.
    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    /// @brief First argument, or an empty view when none remain.
    [[nodiscard]] std::string_view front() const
    {
        return empty() ? std::string_view{} : std::string_view(argv[0]);
    }

    /// @brief Argument at @p index, or an empty view when out of range.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
        {
            return std::string_view{};
        }
        return std::string_view(argv[index]);
    }

    /// @brief Suffix view that skips the first @p count entries.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
        {
            return ArgvView{0, nullptr};
        }
        return ArgvView{argc - count, argv + count};
    }
};

} // namespace pulse::tools
