#ifndef SQUISHER_FILE_UTILS_HPP
#define SQUISHER_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace squisher {

    /**
     * @brief Closes a FILE pointer on scope exit.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wbx").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Opens @p path for reading.
     * @throws IoError if the file cannot be opened.
     */
    unique_FILE open_for_reading(const std::filesystem::path &path);

    /**
     * @brief Fail-if-exists create of @p path for binary writing.
     * @throws DestinationExistsError if @p path already exists.
     * @throws IoError on any other failure.
     */
    unique_FILE create_new_file(const std::filesystem::path &path);

    /**
     * @brief Flushes and closes a file produced by create_new_file.
     * @throws IoError if buffered data cannot be written out.
     */
    void finish_file(unique_FILE &file, const std::filesystem::path &path);

    /**
     * @brief Writes the whole buffer, throwing IoError on a short write.
     */
    void write_all(FILE *out, const void *data, std::size_t size, const std::filesystem::path &path);

    /**
     * @brief Creates the parent directories of @p path if missing.
     *
     * Safe to race from several workers: an already existing directory
     * is not an error.
     * @throws IoError if a directory cannot be created.
     */
    void ensure_parent_dirs(const std::filesystem::path &path);

    /**
     * @brief Reads an entire file into memory.
     * @throws IoError if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes @p bytes to a new file (fail-if-exists).
     */
    void write_new_file(const std::filesystem::path &path, const std::vector<std::uint8_t> &bytes);

    /**
     * @brief Byte-for-byte copy of @p from into a new file @p to (fail-if-exists).
     */
    void copy_new_file(const std::filesystem::path &from, const std::filesystem::path &to);

    /**
     * @brief Copies @p from to @p to unless @p to already exists.
     * @return true if the copy was made, false if it was skipped.
     * @throws IoError if the copy fails for any other reason.
     */
    bool copy_if_absent(const std::filesystem::path &from, const std::filesystem::path &to);

} // namespace squisher

#endif // SQUISHER_FILE_UTILS_HPP
