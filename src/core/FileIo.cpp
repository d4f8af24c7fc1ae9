// SPDX-License-Identifier: Apache-2.0
#include "FileIo.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace voxsrt
{

auto readTextFile(const std::filesystem::path& path) -> Result<std::string>
{
    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

auto writeFileAtomically(const std::filesystem::path& path, std::string_view content) -> VoidResult
{
    auto ec = std::error_code {};
    auto const dir = path.parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    auto tempPath = path;
    tempPath += ".tmp";

    {
        auto file = std::ofstream(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write file: {}", tempPath.string()));

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file)
        {
            file.close();
            std::filesystem::remove(tempPath, ec);
            return makeError(ErrorCode::IoError, std::format("Failed to write file: {}", tempPath.string()));
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec)
    {
        auto const message = ec.message();
        std::filesystem::remove(tempPath, ec);
        return makeError(ErrorCode::IoError,
                         std::format("Failed to move '{}' into place: {}", path.string(), message));
    }

    return {};
}

} // namespace voxsrt
