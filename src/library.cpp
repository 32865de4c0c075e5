#include "library.hpp"
#include "cl_command.hpp"
#include "ilibrary_errors.hpp"
#include "local_archive.hpp"
#include "save_file_manager.hpp"

namespace {

TransferSessionFactory sftpFactory() {
    return [] { return std::make_unique<SftpTransferSession>(); };
}

} // namespace

const char* toString(SaveState state) {
    switch (state) {
    case SaveState::Init:
        return "Init";
    case SaveState::ContainerCreated:
        return "ContainerCreated";
    case SaveState::Populated:
        return "Populated";
    case SaveState::Transferred:
        return "Transferred";
    case SaveState::RemoteCleaned:
        return "RemoteCleaned";
    case SaveState::Done:
        return "Done";
    case SaveState::Failed:
        return "Failed";
    }
    return "Unknown";
}

Library::Library(const HostConfig& config, TransferSessionFactory transferFactory)
    : config_(config),
      owned_(std::make_unique<OdbcCommandChannel>(config_)),
      channel_(owned_.get()),
      transferFactory_(transferFactory ? std::move(transferFactory) : sftpFactory()),
      notifier_(makeNotifier(config_.telegramConfig)) {
    owned_->open();
}

Library::Library(CommandChannel& channel, const HostConfig& config, TransferSessionFactory transferFactory)
    : config_(config),
      channel_(&channel),
      transferFactory_(transferFactory ? std::move(transferFactory) : sftpFactory()),
      notifier_(makeNotifier(config_.telegramConfig)) {}

Library::~Library() {
    iclose();
}

void Library::iclose() {
    if (owned_) {
        owned_->close();
    }
}

bool Library::saveLibrary(const SaveLibraryRequest& request) {
    state_ = SaveState::Init;
    downloadPath_.clear();

    // Everything is validated and every command is built before the first one is sent.
    const std::string library = ClCommand::objectName(request.library, "library");
    const std::string saveFileName = ClCommand::objectName(request.saveFileName, "save file");
    const std::string toLibrary =
        request.toLibrary.empty() ? library : ClCommand::objectName(request.toLibrary, "library");
    const std::string createCommand = ClCommand::createSaveFile(toLibrary, saveFileName, request.description);
    const std::string deleteCommand = ClCommand::deleteFile(toLibrary, saveFileName);
    const std::string saveCommand = ClCommand::saveLibrary(library, toLibrary, saveFileName, request.version);

    std::string remoteFile;
    std::string localFile;
    std::string copyCommand;
    std::string removeStreamCommand;
    int port = config_.sshPort;
    if (request.getZip) {
        if (request.remotePath.empty()) {
            throw ValidationError("A remote path is required. Use 'remotePath' instead.");
        }
        if (request.localPath.empty()) {
            throw ValidationError("A local path is required. Use 'localPath' instead.");
        }
        remoteFile = ClCommand::savfPath(ClCommand::stripTrailingSlash(request.remotePath), saveFileName);
        localFile = ClCommand::savfPath(ClCommand::stripTrailingSlash(request.localPath), saveFileName);
        copyCommand = ClCommand::copyToStreamFile(toLibrary, saveFileName, remoteFile);
        removeStreamCommand = ClCommand::removeStreamFile(remoteFile);
        if (request.port) {
            port = *request.port;
        }
        if (port <= 0 || port > 65535) {
            throw ValidationError("Invalid SSH port: " + std::to_string(port));
        }
    }

    SaveFileManager saveFiles(*channel_, config_);
    if (auto created = saveFiles.run(createCommand, "An error occurred while creating the save file");
        !created) {
        return fail("Save file " + toLibrary + "/" + saveFileName + " could not be created: " +
                    created.error().describe());
    }
    state_ = SaveState::ContainerCreated;

    if (auto saved = runCommand(saveCommand); !saved) {
        config_.logError("Save file " + toLibrary + "/" + saveFileName + " was left on the host without data");
        return fail("SAVLIB of library " + library + " failed: " + saved.error().describe());
    }
    state_ = SaveState::Populated;

    if (request.getZip) {
        if (auto copied = runCommand(copyCommand); !copied) {
            return fail("Copy of " + toLibrary + "/" + saveFileName + " to " + remoteFile + " failed: " +
                        copied.error().describe());
        }

        std::expected<void, TransferError> downloaded = std::unexpected(
            TransferError{TransferError::Kind::ProtocolError, "No transfer session available"});
        if (auto session = transferFactory_()) {
            TransferCredentials credentials{config_.system, config_.user, config_.password, port,
                                            config_.sshTimeout};
            downloaded = session->download(remoteFile, localFile, credentials);
        }
        if (!downloaded) {
            state_ = SaveState::Failed;
            std::string message = "Something went wrong with downloading the save file " + remoteFile + ": " +
                                  downloaded.error().describe();
            report(message);
            throw TransferFailedError(message, downloaded.error());
        }
        downloadPath_ = localFile;
        state_ = SaveState::Transferred;

        if (request.removeStreamFile) {
            if (auto removed = runCommand(removeStreamCommand); !removed) {
                config_.logError("Warning: the stream file " + remoteFile + " was not removed from the host: " +
                                 removed.error().describe());
            }
        }

        if (request.compress) {
            auto compressed = compressFile(localFile);
            if (!compressed) {
                return fail(compressed.error());
            }
            downloadPath_ = *compressed;
        }

        if (request.removeSaveFile) {
            if (auto removed = saveFiles.run(deleteCommand, "An error occurred while deleting the save file");
                !removed) {
                state_ = SaveState::Failed;
                std::string message = "The Save File " + saveFileName + " was not successfully removed: " +
                                      removed.error().describe();
                report(message);
                throw RemovalFailedError(message, removed.error());
            }
            state_ = SaveState::RemoteCleaned;
        }
    }

    commit();
    state_ = SaveState::Done;
    if (request.getZip) {
        config_.logMessage("File successfully downloaded to: " + downloadPath_);
    } else {
        config_.logMessage("Library '" + library + "' successfully saved to " + toLibrary + "/" + saveFileName);
    }
    return true;
}

bool Library::removeFile(const std::string& library, const std::string& saveFileName) {
    SaveFileManager saveFiles(*channel_, config_);
    return saveFiles.remove(library, saveFileName).has_value();
}

std::optional<LibraryInfo> Library::queryLibrarySummary(const std::string& library) {
    auto result = channel_->query(ClCommand::libraryInfoQuery(library));
    checkQuery(result, "library information");
    if (result->rows.empty()) {
        return std::nullopt;
    }
    return recordFromRow<LibraryInfo>(result->rows.front());
}

std::vector<ObjectStatistics> Library::queryObjects(const std::string& library) {
    auto result = channel_->query(ClCommand::objectStatisticsQuery(library));
    checkQuery(result, "library objects");
    return recordsFromResult<ObjectStatistics>(*result);
}

std::vector<MemberStatistics> Library::queryMembers(const std::string& library) {
    auto result = channel_->query(ClCommand::memberStatisticsQuery(library));
    checkQuery(result, "source members");
    return recordsFromResult<MemberStatistics>(*result);
}

std::string Library::getInfoForLibrary(const std::string& library) {
    auto info = queryLibrarySummary(library);
    if (!info) {
        Json::Value error(Json::objectValue);
        error["error"] = "No data found for library for Library: " + library;
        return writeJson(error);
    }
    return writeJson(recordToJson(*info));
}

std::string Library::getFileInfo(const std::string& library, bool qFiles) {
    Json::Value listing;
    if (qFiles) {
        listing = recordsToJson(queryMembers(library));
    } else {
        listing = recordsToJson(queryObjects(library));
    }
    commit();
    if (listing.empty()) {
        return "No Files Found in Library: " + library;
    }
    return writeJson(listing);
}

std::expected<void, CommandError> Library::runCommand(const std::string& command) {
    auto result = channel_->execute(command);
    if (!result) {
        if (auto rolledBack = channel_->rollback(); !rolledBack) {
            config_.logError("Rollback failed: " + rolledBack.error().describe());
        }
    }
    return result;
}

void Library::commit() {
    if (auto committed = channel_->commit(); !committed) {
        config_.logError("Commit failed: " + committed.error().describe());
    }
}

bool Library::fail(const std::string& message) {
    state_ = SaveState::Failed;
    report(message);
    return false;
}

void Library::report(const std::string& message) {
    config_.logError(message);
    if (notifier_) {
        if (auto sent = notifier_->notify("iLibrary on " + config_.system + ": " + message); !sent) {
            config_.logError(sent.error());
        }
    }
}

void Library::checkQuery(const std::expected<ResultSet, CommandError>& result, const std::string& what) {
    if (!result) {
        config_.logError("An error occurred while fetching " + what + ": " + result.error().describe());
        if (auto rolledBack = channel_->rollback(); !rolledBack) {
            config_.logError("Rollback failed: " + rolledBack.error().describe());
        }
        throw QueryError(result.error());
    }
}
