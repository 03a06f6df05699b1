#pragma once

#include "sources/IByteSource.hpp"

#include <filesystem>
#include <memory>

namespace sources {

/**
 * @brief Pick the source variant for an image path
 *
 * Files ending in ".adf" (any case) are Amiga images; everything else is
 * written as a raw image.
 */
[[nodiscard]] auto open_image(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<IByteSource>, TransferError>;

}  // namespace sources
