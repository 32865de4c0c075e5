/**
 * @file library.hpp
 * @brief Save and inspect IBM i libraries.
 *
 * The Library class runs the save workflow
 *
 *     CRTSAVF -> SAVLIB -> [CPYTOSTMF + SFTP download -> rm stream file] -> [DLTF]
 *
 * over one command connection, and answers read-only metadata queries about libraries and
 * the objects in them.
 *
 * @note A Library (and the command channel it uses) serves one caller at a time. Running
 * two saves over the same connection concurrently is not supported.
 */

#ifndef LIBRARY_HPP
#define LIBRARY_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "command_channel.hpp"
#include "host_config.hpp"
#include "library_info.hpp"
#include "notification.hpp"
#include "transfer_session.hpp"

/**
 * @brief Parameters of one save run.
 */
struct SaveLibraryRequest {
    std::string library;          ///< Library to save.
    std::string saveFileName;     ///< Save file that receives the library.
    std::string toLibrary;        ///< Library holding the save file; empty means `library`.
    std::string description;      ///< Save file TEXT; empty means "A SaveFile from iLibrary".
    std::string version;          ///< Target release; empty means *CURRENT.

    bool getZip = false;          ///< Download the save file after saving.
    std::string remotePath;       ///< IFS directory for the temporary stream file (getZip).
    std::string localPath;        ///< Local directory receiving <SAVF>.savf (getZip).
    std::optional<int> port;      ///< SSH port; unset means the configured port (2222).
    bool removeStreamFile = true; ///< Delete the temporary stream file after the download.
    bool removeSaveFile = true;   ///< Delete the save file from the host after the download.
    bool compress = false;        ///< Gzip the downloaded file to <SAVF>.savf.gz.
};

/**
 * @brief Progress of the most recent save run.
 */
enum class SaveState {
    Init,
    ContainerCreated, ///< CRTSAVF succeeded.
    Populated,        ///< SAVLIB succeeded.
    Transferred,      ///< The save file was downloaded.
    RemoteCleaned,    ///< The save file was deleted from the host.
    Done,
    Failed
};

const char* toString(SaveState state);

/**
 * @brief Saves and inspects libraries on one IBM i host.
 *
 * A Library either owns its command connection (constructed from a HostConfig: opened in
 * the constructor, closed by iclose() or the destructor) or borrows one from the caller, in
 * which case it never closes it. Download sessions are created per transfer and owned by
 * the Library for the duration of that step.
 */
class Library {
public:
    /**
     * @brief Opens an owned connection to the configured host.
     *
     * @param config Host, credentials and logging configuration.
     * @param transferFactory Creates download sessions; empty means SFTP via libssh.
     * @throws std::runtime_error If the connection cannot be opened or the notifier is misconfigured.
     */
    explicit Library(const HostConfig& config, TransferSessionFactory transferFactory = {});

    /**
     * @brief Uses a connection managed by the caller.
     *
     * @param channel Open command channel. It must outlive this object and is never closed by it.
     * @param config Credentials for downloads and logging configuration.
     * @param transferFactory Creates download sessions; empty means SFTP via libssh.
     */
    Library(CommandChannel& channel, const HostConfig& config, TransferSessionFactory transferFactory = {});

    ~Library();

    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;

    /**
     * @brief Saves a library into a new save file, optionally downloading it.
     *
     * Steps run in order and each one needs the previous one to succeed. A failed command
     * rolls the connection back and returns false. Nothing is retried, and a save file left
     * empty by a failed SAVLIB is not deleted.
     *
     * @param request What to save and where.
     * @return true when every requested step succeeded, false when a host command failed.
     * @throws ValidationError If the request is invalid. Nothing has been sent to the host.
     * @throws TransferFailedError If the download failed. The save file and the stream file stay on the host.
     * @throws RemovalFailedError If the save file could not be deleted after a successful download.
     */
    bool saveLibrary(const SaveLibraryRequest& request);

    /**
     * @brief Deletes a save file from the host.
     *
     * @return true if DLTF succeeded.
     * @throws ValidationError If a name is invalid.
     */
    bool removeFile(const std::string& library, const std::string& saveFileName);

    /**
     * @brief Reads QSYS2.LIBRARY_INFO for one library.
     *
     * @return The summary, or std::nullopt if the host returned no row.
     * @throws ValidationError If the library name is empty or longer than 10 characters.
     * @throws QueryError If the query failed.
     */
    std::optional<LibraryInfo> queryLibrarySummary(const std::string& library);

    /// Every object of a library. Throws like queryLibrarySummary().
    std::vector<ObjectStatistics> queryObjects(const std::string& library);

    /// Source members of a library. Throws like queryLibrarySummary().
    std::vector<MemberStatistics> queryMembers(const std::string& library);

    /**
     * @brief Library summary as JSON.
     *
     * @return The summary object, or {"error": "No data found for library for Library: <lib>"}.
     */
    std::string getInfoForLibrary(const std::string& library);

    /**
     * @brief Objects (or source members when qFiles is true) of a library as a JSON array.
     *
     * @return The array, or "No Files Found in Library: <lib>" when the library is empty.
     */
    std::string getFileInfo(const std::string& library, bool qFiles = false);

    /**
     * @brief Closes an owned connection. Does nothing for a borrowed one.
     */
    void iclose();

    bool ownsConnection() const { return owned_ != nullptr; }

    SaveState lastState() const { return state_; }

    /// Local path of the last downloaded file (with .gz when compressed), empty if none.
    const std::string& lastDownloadPath() const { return downloadPath_; }

    void setNotifier(std::unique_ptr<NotificationStrategy> notifier) { notifier_ = std::move(notifier); }

private:
    std::expected<void, CommandError> runCommand(const std::string& command);
    void commit();
    bool fail(const std::string& message);
    void report(const std::string& message);
    void checkQuery(const std::expected<ResultSet, CommandError>& result, const std::string& what);

    HostConfig config_;
    std::unique_ptr<OdbcCommandChannel> owned_;
    CommandChannel* channel_;
    TransferSessionFactory transferFactory_;
    std::unique_ptr<NotificationStrategy> notifier_;
    SaveState state_ = SaveState::Init;
    std::string downloadPath_;
};

#endif // LIBRARY_HPP
