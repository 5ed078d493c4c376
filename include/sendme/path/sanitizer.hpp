#pragma once

#include "sendme/core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sendme::path {

/**
 * @brief Validate a single name segment
 *
 * Rejects empty segments, "." and "..", segments containing '/' or '\\',
 * NUL bytes, and bytes that are not well-formed UTF-8.
 */
Result<void> validate_path_component(std::string_view component);

/**
 * @brief Convert an already relative (or canonical) filesystem path to a
 *        '/'-joined name
 *
 * When @p must_be_relative is true a root directory component is rejected;
 * otherwise it is rendered as a leading '/'. Any "." or ".." component, root
 * name, or component failing validate_path_component() yields InvalidPath.
 */
Result<std::string> canonicalized_path_to_string(const std::filesystem::path& path,
                                                 bool must_be_relative);

/**
 * @brief Derive the collection entry name of @p file beneath @p import_root
 *
 * The import root itself is not part of the name. Fails with InvalidPath if
 * @p file does not lie strictly beneath the root.
 */
Result<std::string> entry_name(const std::filesystem::path& import_root,
                               const std::filesystem::path& file);

/**
 * @brief Re-validate a stored '/'-joined entry name
 *
 * Returns the name unchanged when every segment passes
 * validate_path_component() and the name is relative.
 */
Result<std::string> sanitize_name(std::string_view name);

/**
 * @brief Map an untrusted entry name onto a path beneath @p destination_root
 */
Result<std::filesystem::path> destination_path(const std::filesystem::path& destination_root,
                                               std::string_view name);

} // namespace sendme::path
