/**
 * @file batcher.hpp
 * @brief Groups attachment files into mail-sized batches.
 */

#ifndef BATCHER_HPP
#define BATCHER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

struct AttachmentFile {
    std::filesystem::path path; ///< File to attach.
    std::uintmax_t size = 0;    ///< Size in bytes.
};

using Batch = std::vector<AttachmentFile>;

/**
 * @brief Reads the sizes of @p paths.
 *
 * @throws std::filesystem::filesystem_error If a file cannot be stat'ed.
 */
std::vector<AttachmentFile> describeFiles(const std::vector<std::filesystem::path>& paths);

/**
 * @brief Sum of the file sizes in a batch.
 */
std::uintmax_t batchSize(const Batch& batch);

/**
 * @brief Greedy forward-fill batcher.
 *
 * Files are appended to the current batch while the running total stays
 * within the ceiling; the next file that would overflow it opens a new batch.
 * Order is preserved and no file is ever split. A file larger than the ceiling
 * on its own still forms a one-file batch.
 */
class AttachmentBatcher {
public:
    explicit AttachmentBatcher(std::uintmax_t ceiling);

    /**
     * @brief Partitions @p files into ordered batches.
     */
    std::vector<Batch> partition(const std::vector<AttachmentFile>& files) const;

    /**
     * @brief Plans the full delivery: parts partitioned, tool bundle first in batch 1.
     *
     * The bundle is placed in front of batch 1 after partitioning and its size
     * is not counted against the ceiling, so batch 1 may exceed the ceiling by
     * the bundle size (a few hundred bytes in practice). This overshoot is
     * accepted rather than reshuffling the parts.
     *
     * @param parts Archive parts in restore order.
     * @param toolBundle Restore tool bundle, if one was generated.
     */
    std::vector<Batch> plan(const std::vector<AttachmentFile>& parts, const std::optional<AttachmentFile>& toolBundle) const;

    std::uintmax_t ceiling() const { return limit; }

private:
    std::uintmax_t limit;
};

#endif // BATCHER_HPP
