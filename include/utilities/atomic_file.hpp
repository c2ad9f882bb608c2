#ifndef SHAREDICT_ATOMIC_FILE_HPP
#define SHAREDICT_ATOMIC_FILE_HPP

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace sharedict {

/**
 * @brief Replace @p path with @p data so readers see the old or the new
 * contents, never a mix.
 *
 * Data goes to "<path>.tmp" first, is fsync()ed when @p sync is set, and is
 * then rename()d over @p path.
 * @throw std::system_error On any I/O failure; @p path is left untouched.
 */
void writeFileAtomically(const std::string &path,
                         std::span<const std::byte> data, bool sync = true);

/**
 * @brief Read a whole file.
 * @throw std::system_error If the file cannot be opened or read.
 */
std::vector<std::byte> readFileBytes(const std::string &path);

} // namespace sharedict

#endif // SHAREDICT_ATOMIC_FILE_HPP
