/**
 * @file editor.h
 * @brief Launch an external text editor on a file and wait for it.
 *
 * The editor runs as a child process that inherits the caller's standard
 * streams. The call blocks until the child exits; there is no timeout.
 */

#ifndef TABEDIT_EDITOR_H
#define TABEDIT_EDITOR_H

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tabedit {

/// Editor used when neither an override nor $EDITOR is set.
constexpr const char* DEFAULT_EDITOR = "vi";

/// Thrown when the editor cannot be started or does not exit cleanly.
class EditorException : public std::runtime_error {
public:
  explicit EditorException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Split an editor command string on spaces into program and arguments.
 *
 * Runs of spaces are collapsed; no shell quoting is interpreted.
 * "code --wait" becomes {"code", "--wait"}.
 */
std::vector<std::string> split_editor_command(const std::string& command);

/**
 * @brief Resolve the editor command: the override if given, else $EDITOR,
 * else DEFAULT_EDITOR.
 */
std::vector<std::string> resolve_editor_command(const std::optional<std::string>& override_command);

/**
 * @brief Run `command` with `path` appended and wait for it to exit.
 *
 * @return The child's exit status (128 + signal number when killed by a signal).
 * @throws EditorException if the command is empty or the process cannot be spawned.
 */
int run_editor(const std::string& path, const std::vector<std::string>& command);

} // namespace tabedit

#endif // TABEDIT_EDITOR_H
