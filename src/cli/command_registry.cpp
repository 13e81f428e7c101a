#include <cairn/cli/command_registry.h>

namespace cairn::cli {

std::vector<std::unique_ptr<ICommand>> CommandRegistry::createAllCommands() {
    std::vector<std::unique_ptr<ICommand>> commands;
    commands.push_back(createIngestCommand());
    commands.push_back(createImportCommand());
    commands.push_back(createNodeCommand());
    commands.push_back(createChildrenCommand());
    commands.push_back(createRelatedCommand());
    commands.push_back(createLinkCommand());
    commands.push_back(createModuleCommand());
    commands.push_back(createSimilarCommand());
    commands.push_back(createReindexCommand());
    commands.push_back(createStatsCommand());
    return commands;
}

} // namespace cairn::cli
