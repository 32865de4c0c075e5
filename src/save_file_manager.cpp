#include "save_file_manager.hpp"
#include "cl_command.hpp"
#include "host_config.hpp"

SaveFileManager::SaveFileManager(CommandChannel& channel, const HostConfig& config)
    : channel_(channel), config_(config) {}

std::expected<void, CommandError> SaveFileManager::create(const std::string& saveFileName,
                                                         const std::string& library,
                                                         const std::string& description) {
    std::string command = ClCommand::createSaveFile(library, saveFileName, description);
    return run(command, "An error occurred while creating the save file");
}

std::expected<void, CommandError> SaveFileManager::remove(const std::string& library,
                                                         const std::string& saveFileName) {
    std::string command = ClCommand::deleteFile(library, saveFileName);
    return run(command, "An error occurred while deleting the save file");
}

std::expected<void, CommandError> SaveFileManager::run(const std::string& command,
                                                      const std::string& failureContext) {
    auto result = channel_.execute(command);
    if (!result) {
        config_.logError(failureContext + ": " + result.error().describe());
        if (auto rolledBack = channel_.rollback(); !rolledBack) {
            config_.logError("Rollback failed: " + rolledBack.error().describe());
        }
        return result;
    }
    if (auto committed = channel_.commit(); !committed) {
        config_.logError("Commit failed: " + committed.error().describe());
    }
    return {};
}
