#pragma once

#include <cairn/cli/command.h>

#include <memory>
#include <vector>

namespace cairn::cli {

class CommandRegistry {
public:
    static std::vector<std::unique_ptr<ICommand>> createAllCommands();

    static std::unique_ptr<ICommand> createIngestCommand();
    static std::unique_ptr<ICommand> createImportCommand();
    static std::unique_ptr<ICommand> createNodeCommand();
    static std::unique_ptr<ICommand> createChildrenCommand();
    static std::unique_ptr<ICommand> createRelatedCommand();
    static std::unique_ptr<ICommand> createLinkCommand();
    static std::unique_ptr<ICommand> createModuleCommand();
    static std::unique_ptr<ICommand> createSimilarCommand();
    static std::unique_ptr<ICommand> createReindexCommand();
    static std::unique_ptr<ICommand> createStatsCommand();
};

} // namespace cairn::cli
