/**
 * @file local_archive.hpp
 * @brief Local post-processing of downloaded save files.
 *
 * @note Requires zlib.
 */

#ifndef LOCAL_ARCHIVE_HPP
#define LOCAL_ARCHIVE_HPP

#include <expected>
#include <string>

/**
 * @brief Gzips a file to "<path>.gz" and removes the original on success.
 *
 * On failure the original file is left untouched and a partial .gz file is removed.
 *
 * @param path File to compress.
 * @return std::expected<std::string, std::string> Path of the .gz file or an error message.
 */
std::expected<std::string, std::string> compressFile(const std::string& path);

#endif // LOCAL_ARCHIVE_HPP
