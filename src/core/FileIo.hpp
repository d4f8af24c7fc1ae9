// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace voxsrt
{

/// @brief Reads a whole file into a string, byte for byte.
/// @param path The file to read.
/// @return The file contents, or IoError.
[[nodiscard]] auto readTextFile(const std::filesystem::path& path) -> Result<std::string>;

/// @brief Replaces the contents of @p path without ever leaving it half written.
///
/// The content goes to a sibling temporary file that is renamed over @p path once
/// it has been written completely. Missing parent directories are created.
/// @param path The destination file.
/// @param content The bytes to write.
/// @return Success or IoError.
[[nodiscard]] auto writeFileAtomically(const std::filesystem::path& path, std::string_view content) -> VoidResult;

} // namespace voxsrt
