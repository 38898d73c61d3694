#ifndef FILEIO_HPP
#define FILEIO_HPP
#include <cstdint>
#include <string>
#include <vector>

enum ResolveStatus {
    RESOLVE_OK,
    RESOLVE_NOT_FOUND,
    RESOLVE_INVALID_PATH
};

/**
 * Resolve a requested name against root.
 * The result must stay strictly inside root and name a regular file.
 * @return RESOLVE_OK and the absolute path in out
 **/
ResolveStatus resolve_path(const std::string &root, const std::string &name, std::string &out);

/**
 * Size of a regular file
 * @return -1 when it cannot be read
 **/
int64_t file_size(const std::string &path);

/**
 * Write bytes to path, creating parent directories
 * @return 0 on success, -1 on failure
 **/
int write_file(const std::string &path, const std::vector<uint8_t> &data);

bool file_exists(const std::string &path);

#endif
