#include "tabedit/edit_session.h"

#include "tabedit/comment_util.h"
#include "tabedit/editor.h"
#include "tabedit/io_util.h"

#include <stdexcept>

namespace tabedit {

namespace {

EditResult failure(std::vector<ParseError> errors) {
  EditResult result;
  result.ok = false;
  result.errors = std::move(errors);
  return result;
}

// The edited file is parsed with the dialect it was written in
FinishOptions finish_options_for(const EditOptions& options) {
  FinishOptions finish = options.finish;
  finish.parse.dialect = options.write.dialect;
  return finish;
}

// Parsed names and cells come back trimmed; the original must match that to
// diff without spurious modifications
Table trimmed(const Table& table) {
  Table out;
  out.columns.reserve(table.columns.size());
  for (const auto& col : table.columns) {
    out.columns.emplace_back(trim(col));
  }
  out.rows.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    Row copy;
    for (const auto& [name, value] : row) {
      copy[std::string(trim(name))] = std::string(trim(value));
    }
    out.rows.push_back(std::move(copy));
  }
  return out;
}

} // namespace

const char* return_mode_to_string(ReturnMode mode) {
  switch (mode) {
    case ReturnMode::FULL: return "full";
    case ReturnMode::DIFF: return "diff";
    case ReturnMode::CHANGES_ONLY: return "changes_only";
    default: return "unknown";
  }
}

ReturnMode return_mode_from_name(const std::string& name) {
  if (name == "full") return ReturnMode::FULL;
  if (name == "diff") return ReturnMode::DIFF;
  if (name == "changes_only") return ReturnMode::CHANGES_ONLY;
  throw std::invalid_argument("Unknown return_mode: " + name);
}

std::string prepare_edit(const Table& table, const std::optional<std::string>& destination,
                         const WriteOptions& options) {
  std::string path = (destination.has_value() && !destination->empty())
                         ? *destination
                         : create_temp_file("tabedit");
  write_file(path, write_table(table, options));
  return path;
}

std::string prepare_edit(const TableSource& source, const std::optional<std::string>& destination,
                         const WriteOptions& options) {
  return prepare_edit(normalize(source), destination, options);
}

EditResult finish_edit(const std::string& path, const FinishOptions& options) {
  ParseResult parsed = parse_table_file(path, options.parse);
  if (parsed.errors.has_errors()) {
    return failure(parsed.errors.errors());
  }

  ErrorCollector validation = validate(parsed.columns, parsed.rows, options.validation);
  if (validation.has_errors()) {
    return failure(validation.errors());
  }

  EditResult result;
  if (options.return_mode == ReturnMode::FULL) {
    result.ok = true;
    result.result = parsed.table();
    return result;
  }

  if (!options.original_table.has_value() || !options.validation.key_columns.has_value()) {
    return failure({ParseError(ErrorCode::INVALID_CONFIGURATION, ErrorSeverity::ERROR, 0, 1,
                               std::string("return_mode ") + return_mode_to_string(options.return_mode) +
                                   " requires original_table and key_columns")});
  }

  // Restrict the original rows to its own columns so cells compare like parsed rows
  Table original = trimmed(normalize(RowTable(*options.original_table)));
  TableDiff diff = diff_tables(original.rows, parsed.rows, *options.validation.key_columns);

  result.ok = true;
  if (options.return_mode == ReturnMode::DIFF) {
    result.result = std::move(diff);
  } else {
    ChangedRows changes;
    changes.added = std::move(diff.added);
    for (auto& pair : diff.modified) {
      changes.modified.push_back(std::move(pair.second));
    }
    result.result = std::move(changes);
  }
  return result;
}

PendingEdit start_edit(const Table& table, const EditOptions& options) {
  PendingEdit pending;
  pending.path = prepare_edit(table, options.path, options.write);
  FinishOptions finish = finish_options_for(options);
  std::string path = pending.path;
  pending.finish = [path, finish]() { return finish_edit(path, finish); };
  return pending;
}

PendingEdit start_edit(const TableSource& source, const EditOptions& options) {
  return start_edit(normalize(source), options);
}

EditResult edit_table(const Table& table, const EditOptions& options) {
  PendingEdit pending = start_edit(table, options);

  std::vector<std::string> command = resolve_editor_command(options.editor);
  int status = run_editor(pending.path, command);
  if (status != 0) {
    throw EditorException("editor '" + command[0] + "' exited with status " +
                          std::to_string(status));
  }

  return pending.finish();
}

EditResult edit_table(const TableSource& source, const EditOptions& options) {
  return edit_table(normalize(source), options);
}

} // namespace tabedit
