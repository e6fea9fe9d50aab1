#pragma once
/** @file  Console.hpp
 *  @brief Operator prompt (y/n) on the controlling terminal.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iosfwd>
#include <string>

namespace keel {
  namespace io {

    /**
 * @class Console
 * @brief Wraps stdin/stdout for the go/no-go confirmation.
 *
 *  * `interactive()` is false when stdin is not a TTY.
 */
    class Console {
    public:
      Console(std::istream& in, std::ostream& out) : in_(in), out_(out) {}
      virtual ~Console() = default;

      virtual bool interactive() const;

      /// Prints \p question + " [y/N] " and reads one line; EOF counts as "no".
      virtual bool confirm(const std::string& question);

    private:
      std::istream& in_;
      std::ostream& out_;
    };

  } // namespace io
} // namespace keel
