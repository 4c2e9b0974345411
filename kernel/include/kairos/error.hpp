/**
 * @file error.hpp
 * @brief Error codes returned by the kernel
 *
 * Recoverable failures are returned to the caller. Corruption and
 * misconfiguration never come back this way: they go through the kernel's
 * fault path instead.
 */

#ifndef KAIROS_ERROR_HPP
#define KAIROS_ERROR_HPP

#include <cstdint>

namespace kairos
{

enum class Error : std::uint8_t
{
   None = 0,
   InvalidPriority,    ///< Priority outside the configured level count
   StackTooSmall,      ///< Stack cannot hold a context frame plus the canary
   TaskLimitExceeded,  ///< All task slots in use
   InvalidTask,        ///< Unknown, stale or already reaped task id
   InvalidState,       ///< Task is not in a state that allows the operation
   WouldNotBlock,      ///< Futex cell did not hold the expected value
   NotPermitted,       ///< Wrong calling context (interrupt, idle, the caller itself)
   NotInitialised,     ///< Kernel not initialised or not started
};

[[nodiscard]] constexpr const char* to_string(Error error) noexcept
{
   switch (error) {
      case Error::None:              return "None";
      case Error::InvalidPriority:   return "InvalidPriority";
      case Error::StackTooSmall:     return "StackTooSmall";
      case Error::TaskLimitExceeded: return "TaskLimitExceeded";
      case Error::InvalidTask:       return "InvalidTask";
      case Error::InvalidState:      return "InvalidState";
      case Error::WouldNotBlock:     return "WouldNotBlock";
      case Error::NotPermitted:      return "NotPermitted";
      case Error::NotInitialised:    return "NotInitialised";
   }
   return "???";
}

/**
 * @brief A value or the reason there is none
 */
template<typename T>
class [[nodiscard]] Result
{
   T     val{};
   Error err{Error::None};

public:
   constexpr Result(T value) : val(value) {}  // Intentionally implicit
   constexpr Result(Error error) : err(error) {}  // Intentionally implicit

   [[nodiscard]] constexpr bool ok() const noexcept { return err == Error::None; }
   constexpr explicit operator bool() const noexcept { return ok(); }

   [[nodiscard]] constexpr Error error() const noexcept { return err; }

   /// Only meaningful when ok()
   [[nodiscard]] constexpr T value() const noexcept { return val; }
   [[nodiscard]] constexpr T value_or(T fallback) const noexcept { return ok() ? val : fallback; }
};

}  // namespace kairos

#endif // KAIROS_ERROR_HPP
