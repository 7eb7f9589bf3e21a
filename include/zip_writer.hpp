/**
 * @file zip_writer.hpp
 * @brief Minimal RAII wrapper around a libarchive zip writer.
 *
 * Used for the backup archive itself and for the restore tool bundle. When a
 * password is supplied the entries are protected with traditional PKWARE
 * encryption, the scheme `zip -P` produces and every unzip tool understands.
 *
 * @note Requires libarchive 3.3 or newer for zip encryption support.
 */

#ifndef ZIP_WRITER_HPP
#define ZIP_WRITER_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

struct archive;

/**
 * @brief Outcome of adding one file to the archive.
 */
enum class EntryStatus {
    Added,   ///< Entry written completely.
    Skipped, ///< Benign problem (file vanished, unreadable); entry not written.
    Partial  ///< Header written but the file could not be read to the end.
};

/**
 * @brief Writes a zip archive entry by entry.
 */
class ZipWriter {
public:
    ZipWriter() = default;
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Creates the output file and configures the zip format.
     *
     * @param outputFile Archive path; parent directories must exist.
     * @param password Optional password. Callers pass std::nullopt for no protection.
     * @return std::expected<void, std::string> Success or the libarchive error.
     */
    std::expected<void, std::string> open(const std::filesystem::path& outputFile,
                                          const std::optional<std::string>& password = std::nullopt);

    /**
     * @brief Adds a directory entry.
     *
     * @param source Directory on disk, used for permissions and timestamps.
     * @param entryName Name inside the archive (without trailing slash).
     */
    std::expected<void, std::string> addDirectory(const std::filesystem::path& source, const std::string& entryName);

    /**
     * @brief Streams a regular file into the archive.
     *
     * A file that cannot be opened is reported as EntryStatus::Skipped and a
     * short read as EntryStatus::Partial; neither is an error. Errors are
     * reserved for failures of the archive itself.
     *
     * @param source File on disk.
     * @param entryName Name inside the archive.
     * @return std::expected<EntryStatus, std::string> Entry status or the libarchive error.
     */
    std::expected<EntryStatus, std::string> addFile(const std::filesystem::path& source, const std::string& entryName);

    /**
     * @brief Finalizes the central directory and closes the file.
     */
    std::expected<void, std::string> close();

private:
    std::string lastError() const;

    struct archive* handle = nullptr; ///< Open libarchive writer, null when closed.
    std::filesystem::path outputFile;  ///< Path being written.
};

#endif // ZIP_WRITER_HPP
