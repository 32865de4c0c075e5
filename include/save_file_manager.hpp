/**
 * @file save_file_manager.hpp
 * @brief Creates and deletes save files (*SAVF objects) on the host.
 */

#ifndef SAVE_FILE_MANAGER_HPP
#define SAVE_FILE_MANAGER_HPP

#include <expected>
#include <string>
#include "command_channel.hpp"

class HostConfig;

/**
 * @brief Thin wrapper issuing CRTSAVF and DLTF over a borrowed command channel.
 *
 * Each call commits the connection on success and rolls it back on failure. No retries.
 */
class SaveFileManager {
public:
    SaveFileManager(CommandChannel& channel, const HostConfig& config);

    /**
     * @brief Creates a save file.
     *
     * @param saveFileName Name of the save file.
     * @param library Library the save file is created in.
     * @param description TEXT of the save file; empty means "A SaveFile from iLibrary".
     * @return std::expected<void, CommandError> Success or the command failure.
     * @throws ValidationError If a name or the description is invalid. Nothing is sent then.
     */
    std::expected<void, CommandError> create(const std::string& saveFileName, const std::string& library,
                                             const std::string& description = "");

    /**
     * @brief Deletes a save file.
     *
     * Deleting a save file that does not exist fails with the host's CommandError.
     *
     * @throws ValidationError If a name is invalid.
     */
    std::expected<void, CommandError> remove(const std::string& library, const std::string& saveFileName);

    /**
     * @brief Runs an already built CRTSAVF or DLTF command with the same commit/rollback handling.
     *
     * @param command Command from ClCommand::createSaveFile() or ClCommand::deleteFile().
     * @param failureContext Prefix of the error log line when the command fails.
     */
    std::expected<void, CommandError> run(const std::string& command, const std::string& failureContext);

private:
    CommandChannel& channel_;
    const HostConfig& config_;
};

#endif // SAVE_FILE_MANAGER_HPP
