#include "tabedit/editor.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tabedit {

std::vector<std::string> split_editor_command(const std::string& command) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : command) {
    if (c == ' ') {
      if (!current.empty()) {
        parts.push_back(std::move(current));
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(std::move(current));
  }
  return parts;
}

std::vector<std::string> resolve_editor_command(const std::optional<std::string>& override_command) {
  if (override_command.has_value() && !override_command->empty()) {
    return split_editor_command(*override_command);
  }
  const char* env_editor = std::getenv("EDITOR");
  if (env_editor != nullptr && env_editor[0] != '\0') {
    return split_editor_command(env_editor);
  }
  return {DEFAULT_EDITOR};
}

int run_editor(const std::string& path, const std::vector<std::string>& command) {
  if (command.empty()) {
    throw EditorException("editor command is empty");
  }

  std::vector<char*> argv;
  argv.reserve(command.size() + 2);
  for (const auto& arg : command) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(const_cast<char*>(path.c_str()));
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    throw EditorException("could not start editor '" + command[0] + "': " + std::strerror(errno));
  }

  if (pid == 0) {
    // Child process: stdin, stdout and stderr are inherited
    execvp(argv[0], argv.data());
    _exit(127);  // execvp failed
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      throw EditorException("could not wait for editor '" + command[0] + "': " +
                            std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace tabedit
