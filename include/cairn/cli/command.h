#pragma once

#include <cairn/core/types.h>

#include <CLI/CLI.hpp>

#include <string>

namespace cairn::cli {

class CairnCLI;

/**
 * One `cairn <name>` subcommand.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    /**
     * Add the subcommand and its options to app. The subcommand callback should hand
     * itself to cli->setPendingCommand() so it runs after logging is configured.
     */
    virtual void registerCommand(CLI::App& app, CairnCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace cairn::cli
