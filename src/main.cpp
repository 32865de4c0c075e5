#include "ilibrary_errors.hpp"
#include "library.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  save <LIB> <SAVF> [--to-lib <LIB>] [--text <description>] [--version <release>]\n"
              << "                    [--download --remote-dir <dir> --local-dir <dir>] [--port <n>]\n"
              << "                    [--keep-savf] [--keep-stmf] [--compress]\n"
              << "  remove <LIB> <SAVF>\n"
              << "  info <LIB>\n"
              << "  files <LIB> [--members]\n"
              << "\n"
              << "Without --config, DB_DRIVER, DB_SYSTEM, DB_USER and DB_PASSWORD are read from the environment."
              << std::endl;
}

std::optional<int> parsePort(const std::string& raw) {
    try {
        std::size_t used = 0;
        int port = std::stoi(raw, &used);
        if (used != raw.size() || port < 1 || port > 65535) {
            return std::nullopt;
        }
        return port;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int runSave(Library& library, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Error: save needs a library and a save file name" << std::endl;
        return 1;
    }
    SaveLibraryRequest request;
    request.library = args[0];
    request.saveFileName = args[1];
    for (std::size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--to-lib" && hasValue) {
            request.toLibrary = args[++i];
        } else if (arg == "--text" && hasValue) {
            request.description = args[++i];
        } else if (arg == "--version" && hasValue) {
            request.version = args[++i];
        } else if (arg == "--download") {
            request.getZip = true;
        } else if (arg == "--remote-dir" && hasValue) {
            request.remotePath = args[++i];
        } else if (arg == "--local-dir" && hasValue) {
            request.localPath = args[++i];
        } else if (arg == "--port" && hasValue) {
            request.port = parsePort(args[++i]);
            if (!request.port) {
                std::cerr << "Error: invalid port " << args[i] << std::endl;
                return 1;
            }
        } else if (arg == "--keep-savf") {
            request.removeSaveFile = false;
        } else if (arg == "--keep-stmf") {
            request.removeStreamFile = false;
        } else if (arg == "--compress") {
            request.compress = true;
        } else {
            std::cerr << "Error: unknown save option " << arg << std::endl;
            return 1;
        }
    }

    try {
        if (!library.saveLibrary(request)) {
            std::cerr << "Error: save of library " << request.library << " failed" << std::endl;
            return 1;
        }
    } catch (const TransferFailedError& e) {
        std::cerr << "Error: download failed (" << toString(e.cause().kind) << "): " << e.what() << std::endl;
        return 1;
    } catch (const RemovalFailedError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Library " << request.library << " saved successfully." << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string command = args.front();
    args.erase(args.begin());

    try {
        HostConfig config = configFile.empty() ? HostConfig::fromEnvironment() : HostConfig(configFile);
        Library library(config);

        if (command == "save") {
            return runSave(library, args);
        }
        if (command == "remove" && args.size() == 2) {
            return library.removeFile(args[0], args[1]) ? 0 : 1;
        }
        if (command == "info" && args.size() == 1) {
            std::cout << library.getInfoForLibrary(args[0]) << std::endl;
            return 0;
        }
        if (command == "files" && (args.size() == 1 || (args.size() == 2 && args[1] == "--members"))) {
            std::cout << library.getFileInfo(args[0], args.size() == 2) << std::endl;
            return 0;
        }
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
