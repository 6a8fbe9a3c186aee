/**
 * tabedit - Edit delimited tables in a text editor and validate the result.
 *
 * Commands read a table file in the chosen dialect (tab-separated by default)
 * and report parse and validation errors the same way: one line per error on
 * stderr, exit code 1.
 */

#include "tabedit/tabedit.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std;

constexpr const char* VERSION = TABEDIT_VERSION_STRING;

void printVersion() {
  cout << "tabedit version " << VERSION << '\n';
}

void printUsage(const char* prog) {
  cerr << "tabedit - Edit delimited tables in your text editor\n\n";
  cerr << "Usage: " << prog << " <command> [options] <file>\n\n";
  cerr << "Commands:\n";
  cerr << "  check         Parse and validate a file, report errors\n";
  cerr << "  format        Re-write a file with aligned columns (to stdout)\n";
  cerr << "  edit          Open a file in $EDITOR, validate, write back on success\n";
  cerr << "  diff          Compare two files by key columns (diff <original> <edited>)\n";
  cerr << "\nArguments:\n";
  cerr << "  file          Path to a table file, or '-' to read from stdin\n";
  cerr << "                (check and format only).\n";
  cerr << "\nOptions:\n";
  cerr << "  -d <delim>    Field delimiter (default: tab)\n";
  cerr << "                Values: tab, comma, semicolon, pipe, or a literal string\n";
  cerr << "  -q <char>     Quote character (default: \")\n";
  cerr << "  -c <prefix>   Comment prefix (default: #)\n";
  cerr << "  -r <cols>     Comma-separated required columns\n";
  cerr << "  -k <cols>     Comma-separated key columns (unique; required for diff)\n";
  cerr << "  -T <types>    Column types, e.g. id:integer,price:float,active:boolean\n";
  cerr << "  -A            Do not align columns\n";
  cerr << "  -S            Do not write a header separator line\n";
  cerr << "  -F            Do not write the default footer comment\n";
  cerr << "  -e <editor>   Editor command (default: $EDITOR, then vi)\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -v            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " check -k id -T id:integer people.tsv\n";
  cerr << "  " << prog << " format -d comma people.csv\n";
  cerr << "  " << prog << " edit -k id people.tsv\n";
  cerr << "  " << prog << " diff -k id before.tsv after.tsv\n";
}

// Helper to check if reading from stdin
static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

static vector<string> splitList(const string& list) {
  vector<string> items;
  stringstream ss(list);
  string item;
  while (getline(ss, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

static void printErrors(const vector<tabedit::ParseError>& errors) {
  for (const auto& err : errors) {
    cerr << "  " << err.to_string() << '\n';
  }
}

static void printWarning(const string& message) {
  cerr << "Warning: " << message << '\n';
}

// Load and parse a table file; returns false (after reporting) on any error
static bool loadTable(const char* filename, const tabedit::ParseOptions& options,
                      tabedit::ParseResult& result) {
  try {
    if (isStdinInput(filename)) {
      string content = tabedit::read_stdin();
      result = tabedit::parse_table(tabedit::strip_utf8_bom(content), options);
    } else {
      result = tabedit::parse_table_file(filename, options);
    }
  } catch (const std::exception& e) {
    cerr << "Error: " << e.what() << '\n';
    return false;
  }

  if (!result.ok()) {
    cerr << "Error: " << (isStdinInput(filename) ? "<stdin>" : filename) << " has "
         << result.errors.error_count() << " parse error(s):\n";
    printErrors(result.errors.errors());
    return false;
  }
  return true;
}

static string formatRow(const tabedit::Row& row, const vector<string>& columns,
                        const tabedit::Dialect& dialect) {
  string out;
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) {
      out += dialect.delimiter;
    }
    out += tabedit::escape_field(tabedit::cell(row, columns[i]), dialect);
  }
  return out;
}

int cmdCheck(const char* filename, const tabedit::ParseOptions& parse,
             const tabedit::ValidationOptions& validation) {
  tabedit::ParseResult result;
  if (!loadTable(filename, parse, result)) {
    return 1;
  }

  tabedit::ErrorCollector errors = tabedit::validate(result.columns, result.rows, validation);
  if (errors.has_errors()) {
    cerr << "Error: validation failed with " << errors.error_count() << " error(s):\n";
    printErrors(errors.errors());
    return 1;
  }

  cout << "OK: " << result.rows.size() << " rows, " << result.columns.size() << " columns\n";
  return 0;
}

int cmdFormat(const char* filename, const tabedit::ParseOptions& parse,
              const tabedit::WriteOptions& write) {
  tabedit::ParseResult result;
  if (!loadTable(filename, parse, result)) {
    return 1;
  }
  tabedit::write_table(cout, result.table(), write);
  return 0;
}

int cmdEdit(const char* filename, const tabedit::EditOptions& options) {
  if (isStdinInput(filename)) {
    cerr << "Error: edit needs a file path\n";
    return 1;
  }

  tabedit::ParseResult original;
  if (!loadTable(filename, options.finish.parse, original)) {
    return 1;
  }

  tabedit::EditResult result;
  tabedit::PendingEdit pending;
  try {
    pending = tabedit::start_edit(original.table(), options);
    vector<string> command = tabedit::resolve_editor_command(options.editor);
    int status = tabedit::run_editor(pending.path, command);
    if (status != 0) {
      cerr << "Error: editor '" << command[0] << "' exited with status " << status
           << "; " << filename << " left unchanged\n";
      std::remove(pending.path.c_str());
      return 1;
    }
    result = pending.finish();
  } catch (const std::exception& e) {
    cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  if (!result.ok) {
    cerr << "Error: edited table has " << result.errors.size() << " error(s); " << filename
         << " left unchanged:\n";
    printErrors(result.errors);
    cerr << "Your edits were kept in " << pending.path << '\n';
    return 1;
  }

  const tabedit::Table& edited = *result.table();
  if (options.finish.validation.key_columns.has_value()) {
    tabedit::TableDiff diff =
        tabedit::diff_tables(original.rows, edited.rows, *options.finish.validation.key_columns);
    cout << "Added: " << diff.added.size() << ", removed: " << diff.removed.size()
         << ", modified: " << diff.modified.size() << '\n';
  }

  // The editing instructions are not part of the saved file
  tabedit::WriteOptions save = options.write;
  save.header_comment_lines.clear();
  save.default_footer = false;
  try {
    tabedit::write_file(filename, tabedit::write_table(edited, save));
  } catch (const std::exception& e) {
    cerr << "Error: " << e.what() << "; your edits were kept in " << pending.path << '\n';
    return 1;
  }
  std::remove(pending.path.c_str());
  return 0;
}

int cmdDiff(const char* original_file, const char* edited_file, const tabedit::ParseOptions& parse,
            const tabedit::ValidationOptions& validation) {
  if (!validation.key_columns.has_value()) {
    cerr << "Error: -k option required for diff command\n";
    return 1;
  }

  tabedit::ParseResult original;
  tabedit::ParseResult edited;
  if (!loadTable(original_file, parse, original) || !loadTable(edited_file, parse, edited)) {
    return 1;
  }

  tabedit::ErrorCollector errors = tabedit::validate(edited.columns, edited.rows, validation);
  if (errors.has_errors()) {
    cerr << "Error: validation of " << edited_file << " failed with " << errors.error_count()
         << " error(s):\n";
    printErrors(errors.errors());
    return 1;
  }

  tabedit::TableDiff diff =
      tabedit::diff_tables(original.rows, edited.rows, *validation.key_columns);
  const tabedit::Dialect& dialect = parse.dialect;
  for (const auto& row : diff.removed) {
    cout << "- " << formatRow(row, original.columns, dialect) << '\n';
  }
  for (const auto& row : diff.added) {
    cout << "+ " << formatRow(row, edited.columns, dialect) << '\n';
  }
  for (const auto& pair : diff.modified) {
    cout << "~ " << formatRow(pair.first, original.columns, dialect) << '\n';
    cout << "> " << formatRow(pair.second, edited.columns, dialect) << '\n';
  }
  if (diff.empty()) {
    cout << "No differences\n";
  }
  return 0;
}

int main(int argc, char* argv[]) {
  // Disable buffering for stdout so popen() captures everything
  setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  // Check for help or version
  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];

  // Skip command for option parsing
  optind = 2;

  string delimiter_str = "tab";
  char quote_char = '"';
  string comment_prefix = "#";
  tabedit::ValidationOptions validation;
  tabedit::WriteOptions write;
  tabedit::EditOptions edit;

  int c;
  while ((c = getopt(argc, argv, "d:q:c:r:k:T:ASFe:hv")) != -1) {
    switch (c) {
    case 'd':
      delimiter_str = optarg;
      break;
    case 'q':
      if (strlen(optarg) == 1) {
        quote_char = optarg[0];
      } else {
        cerr << "Error: Quote character must be a single character\n";
        return 1;
      }
      break;
    case 'c':
      comment_prefix = optarg;
      break;
    case 'r':
      validation.required_columns = splitList(optarg);
      break;
    case 'k':
      validation.key_columns = splitList(optarg);
      break;
    case 'T':
      for (const auto& decl : splitList(optarg)) {
        size_t colon = decl.rfind(':');
        if (colon == string::npos || colon == 0) {
          cerr << "Error: Invalid column type '" << decl << "' (expected column:type)\n";
          return 1;
        }
        try {
          validation.column_types.emplace_back(decl.substr(0, colon),
                                               tabedit::column_type_from_name(decl.substr(colon + 1)));
        } catch (const std::invalid_argument& e) {
          cerr << "Error: " << e.what() << '\n';
          return 1;
        }
      }
      break;
    case 'A':
      write.align_columns = false;
      break;
    case 'S':
      write.header_separator = false;
      break;
    case 'F':
      write.default_footer = false;
      break;
    case 'e':
      edit.editor = string(optarg);
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  tabedit::Dialect dialect;
  try {
    dialect = tabedit::dialect_from_name(delimiter_str, quote_char, comment_prefix);
  } catch (const std::invalid_argument& e) {
    cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  tabedit::ParseOptions parse;
  parse.dialect = dialect;
  parse.warning_callback = printWarning;
  write.dialect = dialect;

  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }

  int result = 0;
  if (command == "check") {
    result = cmdCheck(filename, parse, validation);
  } else if (command == "format") {
    result = cmdFormat(filename, parse, write);
  } else if (command == "edit") {
    edit.write = write;
    edit.finish.parse = parse;
    edit.finish.validation = validation;
    edit.write.header_comment_lines = {
        "Edit the table below. Save and quit to apply, or leave it unchanged to keep it.",
        ""};
    result = cmdEdit(filename, edit);
  } else if (command == "diff") {
    if (optind + 1 >= argc) {
      cerr << "Error: diff needs two files: <original> <edited>\n";
      return 1;
    }
    result = cmdDiff(argv[optind], argv[optind + 1], parse, validation);
  } else {
    cerr << "Error: Unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return 1;
  }

  std::cout.flush();
  std::cerr.flush();
  return result;
}
