#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution for config-referenced files
 */

#include <string>

namespace viva {

/// Expands a leading ~ to $HOME. ~user is not supported.
std::string expand_path(const std::string& path);

/// Joins a relative path onto base_dir; absolute paths and empty bases pass through.
std::string resolve_relative(const std::string& base_dir, const std::string& path);

/// Platform espeak-ng data directory used by Piper when config leaves it empty.
std::string default_espeak_data_path();

} // namespace viva
