#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution for configured files and directories
 */

#include <string>

namespace carebridge {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Resolves a configured path: ~ is expanded, absolute paths are returned as is,
 * relative paths are taken relative to the directory holding config_path.
 */
std::string resolve_config_relative(const std::string& config_path, const std::string& path);

} // namespace carebridge
