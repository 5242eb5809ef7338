#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace relnotes {

/**
 * @brief Runs a command and reports its failure
 *
 * Failures are logged as "<command>: <kind>: <message>"; the core never
 * terminates the process itself.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// Process exit code for a command result: 0 on success, 1 otherwise
    static int exitCode(const Expected<void>& result) { return result ? 0 : 1; }
};

}
