/**
 * @file splitter.hpp
 * @brief Splits an archive into fixed-size sequential parts.
 *
 * Parts are named `<archive>.001`, `<archive>.002`, ... so that concatenating
 * them in ascending suffix order rebuilds the archive byte for byte.
 */

#ifndef SPLITTER_HPP
#define SPLITTER_HPP

#include "backup_types.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

class CleanupSet;

/// Default part ceiling, sized to stay under common mail attachment limits.
inline constexpr std::uintmax_t kDefaultChunkSize = 45ULL * 1024 * 1024;

class ArchiveSplitter {
public:
    explicit ArchiveSplitter(std::uintmax_t chunkSize = kDefaultChunkSize);

    /**
     * @brief Splits an archive when it exceeds the chunk size.
     *
     * An archive no larger than the chunk size is returned as the only element,
     * untouched. Otherwise every part except the last has exactly chunkSize
     * bytes. Each part file is registered with @p cleanup as soon as it is
     * created, so a failure halfway still leaves nothing behind.
     *
     * @param archive Archive to split.
     * @param cleanup Cleanup set of the current run.
     * @return std::expected<std::vector<std::filesystem::path>, BackupError> Ordered parts or SplitFailed.
     */
    std::expected<std::vector<std::filesystem::path>, BackupError> split(const std::filesystem::path& archive,
                                                                         CleanupSet& cleanup) const;

    /**
     * @brief Name of the 1-based part @p index of @p archive (e.g. "a.zip.007").
     */
    static std::filesystem::path partPath(const std::filesystem::path& archive, size_t index);

    std::uintmax_t chunkSize() const { return chunk; }

private:
    std::uintmax_t chunk;
};

#endif // SPLITTER_HPP
