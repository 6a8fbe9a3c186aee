/**
 * @file io_util.h
 * @brief File I/O helpers for the edit workflow.
 *
 * All functions report failure by throwing std::runtime_error; they never
 * return partially read or written data silently.
 */

#ifndef TABEDIT_IO_UTIL_H
#define TABEDIT_IO_UTIL_H

#include <string>
#include <string_view>

namespace tabedit {

/**
 * @brief Loads an entire file into a string.
 *
 * @param filename The path to the file to load.
 * @return The file contents, byte for byte.
 *
 * @throws std::runtime_error If the file cannot be opened ("could not load file").
 * @throws std::runtime_error If the file cannot be fully read ("could not read the data").
 */
std::string read_file(const std::string& filename);

/**
 * @brief Reads all of standard input into a string.
 *
 * @throws std::runtime_error If reading from stdin fails.
 */
std::string read_stdin();

/**
 * @brief Replaces the contents of a file.
 *
 * @throws std::runtime_error If the file cannot be opened or fully written.
 */
void write_file(const std::string& filename, std::string_view content);

/**
 * @brief Creates an empty, uniquely named temporary file and returns its path.
 *
 * The file lives in $TMPDIR (or /tmp) and is named "<prefix>_XXXXXX" with a
 * random suffix. The caller owns the file and is responsible for removing it.
 *
 * @throws std::runtime_error If the file cannot be created.
 */
std::string create_temp_file(const std::string& prefix = "tabedit");

/**
 * @brief Drops a leading UTF-8 byte order mark (EF BB BF), if present.
 */
std::string_view strip_utf8_bom(std::string_view data);

} // namespace tabedit

#endif // TABEDIT_IO_UTIL_H
