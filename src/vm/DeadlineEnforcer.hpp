//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/DeadlineEnforcer.hpp
// Purpose: Per-method timing against @Deadline budgets.
// Key invariants: Active entries form a stack so nested and recursive calls
//                 of the same method are timed independently.
// Ownership/Lifetime: Owns registrations, active entries and the violations
//                     of the current run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pulse::vm
{

/// @brief Severity of a missed deadline.
enum class DeadlineSeverity
{
    Warning,  ///< Over budget
    Critical, ///< More than twice the budget
};

constexpr std::string_view toString(DeadlineSeverity severity) noexcept
{
    return severity == DeadlineSeverity::Critical ? "CRITICAL" : "WARNING";
}

/// @brief A completed call that exceeded its deadline.
struct DeadlineViolation
{
    std::string methodName;
    double expectedMs = 0;
    double actualMs = 0;
    uint32_t line = 0; ///< Line of the method declaration
    DeadlineSeverity severity = DeadlineSeverity::Warning;
    double timestamp = 0; ///< Wall clock, ms since the epoch
};

/// @brief A call currently being timed.
struct ActiveDeadline
{
    std::string methodName;
    double remainingMs = 0; ///< Never negative
};

/// @brief Records entry/exit times of registered methods.
class DeadlineEnforcer
{
  public:
    /// @brief Monotonic clock in milliseconds.
    using Clock = std::function<double()>;

    /// @brief Create an enforcer; an empty @p clock selects steady_clock.
    explicit DeadlineEnforcer(Clock clock = {});

    /// @brief Register @p methodName with a budget of @p deadlineMs.
    void registerDeadline(const std::string &methodName, double deadlineMs, uint32_t line);

    /// @brief True when @p methodName has a registered deadline.
    [[nodiscard]] bool hasDeadline(const std::string &methodName) const;

    /// @brief Start timing @p methodName; no-op when it is not registered.
    void startMethod(const std::string &methodName);

    /// @brief Stop the innermost timing of @p methodName.
    /// @return The violation when elapsed time exceeded the budget.
    std::optional<DeadlineViolation> endMethod(const std::string &methodName);

    /// @brief Violations recorded since the last clear, in order.
    const std::vector<DeadlineViolation> &violations() const
    {
        return violations_;
    }

    void clearViolations();

    /// @brief Calls being timed, outermost first, with their remaining budget.
    std::vector<ActiveDeadline> activeDeadlines() const;

    /// @brief Drop registrations, active entries and violations.
    void reset();

    /// @brief Replace the clock; an empty @p clock selects steady_clock.
    void setClock(Clock clock);

  private:
    struct Registration
    {
        double deadlineMs = 0;
        uint32_t line = 0;
    };

    struct Active
    {
        std::string methodName;
        double startMs = 0;
        double deadlineMs = 0;
        uint32_t line = 0;
    };

    Clock clock_;
    std::map<std::string, Registration> registrations_;
    std::vector<Active> active_;
    std::vector<DeadlineViolation> violations_;
};

} // namespace pulse::vm
