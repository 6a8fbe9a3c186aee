/**
 * @file edit_session.h
 * @brief Round-trip a table through a text file edited by the user.
 *
 * The workflow has three steps:
 * 1. prepare_edit() writes the table to a file (a fresh temporary file unless
 *    a destination is given)
 * 2. the user edits the file, usually in $EDITOR via edit_table()
 * 3. finish_edit() parses and validates the file and returns the result
 *
 * finish_edit() is all-or-nothing: any parse or validation error makes the
 * result not ok and carries no payload.
 *
 * For tests and non-interactive callers, start_edit() performs step 1 and
 * returns the path together with a callable that performs step 3.
 *
 * @example
 * @code
 * tabedit::EditOptions options;
 * options.finish.validation.key_columns = std::vector<std::string>{"id"};
 *
 * auto result = tabedit::edit_table(table, options);
 * if (result.ok) {
 *     const tabedit::Table& edited = *result.table();
 * } else {
 *     for (const auto& err : result.errors) std::cerr << err.to_string() << "\n";
 * }
 * @endcode
 */

#ifndef TABEDIT_EDIT_SESSION_H
#define TABEDIT_EDIT_SESSION_H

#include "tabedit/error.h"
#include "tabedit/table.h"
#include "tabedit/table_diff.h"
#include "tabedit/table_parser.h"
#include "tabedit/validator.h"
#include "tabedit/writer.h"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabedit {

/// What finish_edit() returns on success.
enum class ReturnMode {
  FULL,          ///< The parsed table
  DIFF,          ///< TableDiff against the original table
  CHANGES_ONLY   ///< Added rows and new versions of modified rows
};

const char* return_mode_to_string(ReturnMode mode);

/// @throws std::invalid_argument for names other than full, diff, changes_only.
ReturnMode return_mode_from_name(const std::string& name);

/// Rows that are new or changed relative to the original table.
struct ChangedRows {
  std::vector<Row> added;
  std::vector<Row> modified;
};

/**
 * @brief Options for finish_edit().
 *
 * DIFF and CHANGES_ONLY need both original_table and
 * validation.key_columns; the key columns are used for validation and for
 * matching rows. Original cells are trimmed before comparing, as parsed cells
 * are, so removed and modified rows report the trimmed values.
 */
struct FinishOptions {
  ParseOptions parse;
  ValidationOptions validation;
  std::optional<Table> original_table;
  ReturnMode return_mode = ReturnMode::FULL;
};

/**
 * @brief Outcome of finish_edit(): ok flag, payload and errors.
 *
 * When ok is false the payload is empty and errors is non-empty.
 */
struct EditResult {
  bool ok = false;
  std::variant<std::monostate, Table, TableDiff, ChangedRows> result;
  std::vector<ParseError> errors;

  const Table* table() const { return std::get_if<Table>(&result); }
  const TableDiff* diff() const { return std::get_if<TableDiff>(&result); }
  const ChangedRows* changes() const { return std::get_if<ChangedRows>(&result); }
};

/**
 * @brief Options for edit_table() and start_edit().
 *
 * The dialect in `write` is also used to parse the edited file.
 */
struct EditOptions {
  WriteOptions write;
  FinishOptions finish;

  /// File to edit; a temporary file is created when unset.
  std::optional<std::string> path;

  /// Editor command; $EDITOR (or vi) when unset.
  std::optional<std::string> editor;
};

/// A prepared edit whose finish step the caller triggers.
struct PendingEdit {
  std::string path;
  std::function<EditResult()> finish;
};

/**
 * @brief Write the table to `destination`, or to a new temporary file.
 *
 * @return The path written.
 * @throws std::runtime_error if the file cannot be created or written.
 */
std::string prepare_edit(const Table& table, const std::optional<std::string>& destination = std::nullopt,
                         const WriteOptions& options = {});

std::string prepare_edit(const TableSource& source,
                         const std::optional<std::string>& destination = std::nullopt,
                         const WriteOptions& options = {});

/**
 * @brief Parse and validate the file at `path`.
 *
 * @throws std::runtime_error if the file cannot be read.
 */
EditResult finish_edit(const std::string& path, const FinishOptions& options = {});

/**
 * @brief Prepare the file and return it with a finish callback; no editor is run.
 */
PendingEdit start_edit(const Table& table, const EditOptions& options = {});
PendingEdit start_edit(const TableSource& source, const EditOptions& options = {});

/**
 * @brief Prepare, open the editor and block until it exits, then finish.
 *
 * @throws EditorException if the editor cannot be started or exits non-zero.
 * @throws std::runtime_error on file I/O failure.
 */
EditResult edit_table(const Table& table, const EditOptions& options = {});
EditResult edit_table(const TableSource& source, const EditOptions& options = {});

} // namespace tabedit

#endif // TABEDIT_EDIT_SESSION_H
