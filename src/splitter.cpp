#include "splitter.hpp"
#include "cleanup_set.hpp"
#include <algorithm>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 1024 * 1024;

std::unexpected<BackupError> splitFailed(const std::string& message) {
    return std::unexpected(BackupError{ErrorKind::SplitFailed, message});
}

} // namespace

ArchiveSplitter::ArchiveSplitter(std::uintmax_t chunkSize) : chunk(std::max<std::uintmax_t>(chunkSize, 1)) {}

fs::path ArchiveSplitter::partPath(const fs::path& archive, size_t index) {
    return fs::path(std::format("{}.{:03d}", archive.string(), index));
}

std::expected<std::vector<fs::path>, BackupError> ArchiveSplitter::split(const fs::path& archive, CleanupSet& cleanup) const {
    std::error_code ec;
    auto totalSize = fs::file_size(archive, ec);
    if (ec) {
        return splitFailed(std::format("Cannot stat archive {}: {}", archive.string(), ec.message()));
    }

    if (totalSize <= chunk) {
        return std::vector<fs::path>{archive};
    }

    std::ifstream input(archive, std::ios::binary);
    if (!input) {
        return splitFailed(std::format("Failed to open archive for splitting: {}", archive.string()));
    }

    std::vector<fs::path> parts;
    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uintmax_t>(chunk, kCopyBufferSize)));
    std::uintmax_t consumed = 0;

    while (consumed < totalSize) {
        fs::path part = partPath(archive, parts.size() + 1);
        cleanup.add(part);

        std::ofstream output(part, std::ios::binary | std::ios::trunc);
        if (!output) {
            return splitFailed(std::format("Failed to create part file: {}", part.string()));
        }

        std::uintmax_t remaining = std::min(chunk, totalSize - consumed);
        while (remaining > 0) {
            auto want = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, buffer.size()));
            input.read(buffer.data(), want);
            if (input.gcount() != want) {
                return splitFailed(std::format("Unexpected end of archive while writing {}", part.string()));
            }
            output.write(buffer.data(), want);
            if (!output) {
                return splitFailed(std::format("Failed to write part file: {}", part.string()));
            }
            remaining -= static_cast<std::uintmax_t>(want);
            consumed += static_cast<std::uintmax_t>(want);
        }

        output.close();
        if (output.fail()) {
            return splitFailed(std::format("Failed to close part file: {}", part.string()));
        }
        parts.push_back(part);
    }

    return parts;
}
