#ifndef SHAREDICT_SUBPROCESS_HPP
#define SHAREDICT_SUBPROCESS_HPP

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace sharedict {

/** Raised when a child process cannot be started or waited for. */
class SubprocessError : public std::runtime_error {
public:
  explicit SubprocessError(const std::string &what)
      : std::runtime_error(what) {}
};

struct SubprocessResult {
  int exitStatus{-1};       ///< Exit code, or 128 + signal number
  std::vector<std::byte> out;
  std::string err;
};

/**
 * @brief Run @p argv (argv[0] looked up on PATH), feeding @p input to its
 * stdin and collecting stdout and stderr.
 *
 * Pipes are serviced with poll() so large inputs and outputs cannot
 * deadlock against each other.
 * @throw SubprocessError On pipe/fork/exec plumbing failures.
 */
SubprocessResult runSubprocess(const std::vector<std::string> &argv,
                               std::span<const std::byte> input);

} // namespace sharedict

#endif // SHAREDICT_SUBPROCESS_HPP
