#include "sources/SourceFactory.hpp"

#include "sources/AdfImageSource.hpp"
#include "sources/ImageFileSource.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace sources {

auto open_image(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<IByteSource>, TransferError> {
    auto extension = path.extension().string();
    std::ranges::transform(extension, extension.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (extension == ".adf") {
        auto adf = AdfImageSource::create(path);
        if (!adf) {
            return std::unexpected(adf.error());
        }
        return std::unique_ptr<IByteSource>(std::move(*adf));
    }

    auto raw = ImageFileSource::create(path);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return std::unique_ptr<IByteSource>(std::move(*raw));
}

}  // namespace sources
