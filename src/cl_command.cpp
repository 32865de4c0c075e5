#include "cl_command.hpp"
#include "ilibrary_errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace {

bool isNameStart(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || c == '$' || c == '#' || c == '@';
}

bool isNameChar(unsigned char c) {
    return isNameStart(c) || (c >= '0' && c <= '9') || c == '_' || c == '.';
}

std::string toUpper(const std::string& value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

std::string ClCommand::objectName(const std::string& name, const std::string& what) {
    if (name.empty()) {
        throw ValidationError("A " + what + " name is required.");
    }
    if (name.size() > kMaxNameLength) {
        throw ValidationError("The " + what + " name is too long. Maximum length is " +
                              std::to_string(kMaxNameLength) + ".");
    }
    std::string upper = toUpper(name);
    if (!isNameStart(static_cast<unsigned char>(upper.front()))) {
        throw ValidationError("The " + what + " name '" + name + "' must start with A-Z, $, # or @.");
    }
    for (unsigned char c : upper) {
        if (!isNameChar(c)) {
            throw ValidationError("The " + what + " name '" + name + "' contains an invalid character.");
        }
    }
    return upper;
}

std::string ClCommand::textValue(const std::string& description) {
    if (description.empty()) {
        return kDefaultDescription;
    }
    if (description.size() > kMaxTextLength) {
        throw ValidationError("The description is too long. Maximum length is " +
                              std::to_string(kMaxTextLength) + ".");
    }
    std::string quoted;
    quoted.reserve(description.size() + 4);
    for (unsigned char c : description) {
        if (std::iscntrl(c)) {
            throw ValidationError("The description contains a control character.");
        }
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += static_cast<char>(c);
        }
    }
    return quoted;
}

std::string ClCommand::releaseValue(const std::string& version) {
    if (version.empty()) {
        return kCurrentRelease;
    }
    static const std::regex release(R"(\*[A-Z]{1,9}|V[0-9]R[0-9]M[0-9])");
    std::string upper = toUpper(version);
    if (!std::regex_match(upper, release)) {
        throw ValidationError("Invalid target release '" + version + "'. Use *CURRENT, *PRV or VxRyMz.");
    }
    return upper;
}

std::string ClCommand::streamPath(const std::string& path) {
    if (path.empty()) {
        throw ValidationError("A remote path is required.");
    }
    if (path.front() == '-') {
        throw ValidationError("The remote path '" + path + "' may not start with '-'.");
    }
    static const std::string forbidden = "'\"`;|&$<>()\\*?~!{}[]";
    for (unsigned char c : path) {
        if (std::iscntrl(c) || std::isspace(c) || forbidden.find(static_cast<char>(c)) != std::string::npos) {
            throw ValidationError("The remote path '" + path + "' contains a character that is not allowed.");
        }
    }
    return path;
}

std::string ClCommand::stripTrailingSlash(const std::string& path) {
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path;
}

std::string ClCommand::savfPath(const std::string& directory, const std::string& saveFileName) {
    std::string fileName = objectName(saveFileName, "save file") + ".savf";
    if (directory == "/") {
        return directory + fileName;
    }
    return directory + "/" + fileName;
}

std::string ClCommand::createSaveFile(const std::string& library, const std::string& saveFileName,
                                      const std::string& description) {
    return "CRTSAVF FILE(" + objectName(library, "library") + "/" + objectName(saveFileName, "save file") +
           ") TEXT('" + textValue(description) + "')";
}

std::string ClCommand::saveLibrary(const std::string& library, const std::string& toLibrary,
                                   const std::string& saveFileName, const std::string& version) {
    return "SAVLIB LIB(" + objectName(library, "library") + ") DEV(*SAVF) SAVF(" +
           objectName(toLibrary, "library") + "/" + objectName(saveFileName, "save file") +
           ") TGTRLS(" + releaseValue(version) + ")";
}

std::string ClCommand::copyToStreamFile(const std::string& library, const std::string& saveFileName,
                                        const std::string& remotePath) {
    return "CPYTOSTMF FROMMBR('/QSYS.LIB/" + objectName(library, "library") + ".LIB/" +
           objectName(saveFileName, "save file") + ".FILE') TOSTMF('" + streamPath(remotePath) +
           "') STMFOPT(*REPLACE)";
}

std::string ClCommand::removeStreamFile(const std::string& remotePath) {
    return "QSH CMD('rm -r " + streamPath(remotePath) + "')";
}

std::string ClCommand::deleteFile(const std::string& library, const std::string& saveFileName) {
    return "DLTF FILE(" + objectName(library, "library") + "/" + objectName(saveFileName, "save file") + ")";
}

std::string ClCommand::libraryInfoQuery(const std::string& library) {
    return "SELECT * FROM TABLE(QSYS2.LIBRARY_INFO(upper('" + objectName(library, "library") + "')))";
}

std::string ClCommand::objectStatisticsQuery(const std::string& library) {
    return "SELECT * FROM TABLE (QSYS2.OBJECT_STATISTICS('" + objectName(library, "library") +
           "','*ALL') ) AS X";
}

std::string ClCommand::memberStatisticsQuery(const std::string& library) {
    return "SELECT * FROM QSYS2.SYSMEMBERSTAT WHERE SYSTEM_TABLE_SCHEMA = '" + objectName(library, "library") +
           "' AND SOURCE_TYPE IS NOT NULL ORDER BY SYSTEM_TABLE_MEMBER";
}
