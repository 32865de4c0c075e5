/**
 * @file cl_command.hpp
 * @brief Builds the CL commands and SQL statements sent to the IBM i host.
 *
 * Every value interpolated into a command passes through a validator first. Object names
 * are uppercased and restricted to the IBM i system name alphabet, description text has
 * its quotes doubled, and stream file paths may not contain quotes, whitespace or shell
 * metacharacters (they end up inside a QSH command line).
 */

#ifndef CL_COMMAND_HPP
#define CL_COMMAND_HPP

#include <cstddef>
#include <string>

/**
 * @brief Static builder for the fixed command shapes used by iLibrary.
 *
 * All functions throw ValidationError on bad input and never touch the network.
 */
class ClCommand {
public:
    static constexpr std::size_t kMaxNameLength = 10;        ///< IBM i system object name limit.
    static constexpr std::size_t kMaxTextLength = 50;        ///< TEXT() parameter limit.
    static constexpr const char* kDefaultDescription = "A SaveFile from iLibrary";
    static constexpr const char* kCurrentRelease = "*CURRENT";

    /**
     * @brief Validates an object name and returns it uppercased.
     *
     * @param name Raw name as supplied by the caller.
     * @param what Human readable role used in error messages ("library", "save file").
     * @throws ValidationError If the name is empty, longer than 10 characters or contains
     *         characters outside A-Z 0-9 $ # @ _ . (first character: A-Z $ # @).
     */
    static std::string objectName(const std::string& name, const std::string& what);

    /**
     * @brief Quotes description text for a TEXT('...') parameter.
     *
     * Empty text becomes kDefaultDescription. Single quotes are doubled.
     *
     * @throws ValidationError If the text has control characters or exceeds 50 characters.
     */
    static std::string textValue(const std::string& description);

    /**
     * @brief Validates a target release, defaulting to *CURRENT.
     *
     * Accepts special values such as *CURRENT or *PRV, or a VxRyMz release.
     */
    static std::string releaseValue(const std::string& version);

    /**
     * @brief Validates an IFS path that will be embedded in CPYTOSTMF and QSH commands.
     */
    static std::string streamPath(const std::string& path);

    /// Strips exactly one trailing '/' (a lone "/" is left alone).
    static std::string stripTrailingSlash(const std::string& path);

    /// "<directory>/<NAME>.savf" with the save file name uppercased.
    static std::string savfPath(const std::string& directory, const std::string& saveFileName);

    /// CRTSAVF FILE(<LIB>/<NAME>) TEXT('<description>')
    static std::string createSaveFile(const std::string& library, const std::string& saveFileName,
                                      const std::string& description);

    /// SAVLIB LIB(<library>) DEV(*SAVF) SAVF(<toLibrary>/<saveFileName>) TGTRLS(<version>)
    static std::string saveLibrary(const std::string& library, const std::string& toLibrary,
                                   const std::string& saveFileName, const std::string& version);

    /// CPYTOSTMF FROMMBR('/QSYS.LIB/<LIB>.LIB/<NAME>.FILE') TOSTMF('<path>') STMFOPT(*REPLACE)
    static std::string copyToStreamFile(const std::string& library, const std::string& saveFileName,
                                        const std::string& remotePath);

    /// QSH CMD('rm -r <path>')
    static std::string removeStreamFile(const std::string& remotePath);

    /// DLTF FILE(<LIB>/<NAME>)
    static std::string deleteFile(const std::string& library, const std::string& saveFileName);

    /// SELECT * FROM TABLE(QSYS2.LIBRARY_INFO(upper('<lib>')))
    static std::string libraryInfoQuery(const std::string& library);

    /// Every object of the library from QSYS2.OBJECT_STATISTICS.
    static std::string objectStatisticsQuery(const std::string& library);

    /// Source members of the library from QSYS2.SYSMEMBERSTAT, ordered by member.
    static std::string memberStatisticsQuery(const std::string& library);
};

#endif // CL_COMMAND_HPP
