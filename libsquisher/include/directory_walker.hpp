#ifndef SQUISHER_DIRECTORY_WALKER_HPP
#define SQUISHER_DIRECTORY_WALKER_HPP

#include <filesystem>
#include <vector>

namespace squisher {

/**
 * @brief Recursively collect the regular files under @p root.
 *
 * Symbolic links are neither followed nor returned. A directory that
 * cannot be read is logged ("Error finding file: ...") and skipped; the
 * walk carries on with everything else. The result is sorted so that a
 * run's submission order does not depend on the filesystem.
 */
std::vector<std::filesystem::path> collect_regular_files(const std::filesystem::path& root);

} // namespace squisher

#endif // SQUISHER_DIRECTORY_WALKER_HPP
