#include "local_archive.hpp"
#include <filesystem>
#include <fstream>
#include <zlib.h>

namespace fs = std::filesystem;

std::expected<std::string, std::string> compressFile(const std::string& path) {
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile.is_open()) {
        return std::unexpected("Failed to open file for compression: " + path);
    }

    std::string gzPath = path + ".gz";
    gzFile outFile = gzopen(gzPath.c_str(), "wb");
    if (!outFile) {
        return std::unexpected("Failed to open gzip file for writing: " + gzPath);
    }

    char buf[8192];
    while (inFile) {
        inFile.read(buf, sizeof(buf));
        std::streamsize n = inFile.gcount();
        if (n > 0 && gzwrite(outFile, buf, static_cast<unsigned>(n)) != static_cast<int>(n)) {
            int errnum = 0;
            std::string reason = gzerror(outFile, &errnum);
            gzclose(outFile);
            std::error_code ec;
            fs::remove(gzPath, ec);
            return std::unexpected("Failed to write " + gzPath + ": " + reason);
        }
    }
    bool readFailed = inFile.bad();
    inFile.close();

    if (gzclose(outFile) != Z_OK || readFailed) {
        std::error_code ec;
        fs::remove(gzPath, ec);
        return std::unexpected("Failed to compress " + path);
    }

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return std::unexpected("Compressed to " + gzPath + " but failed to remove " + path + ": " + ec.message());
    }
    return gzPath;
}
