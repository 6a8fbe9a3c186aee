#include "tabedit/table_diff.h"

#include <map>

namespace tabedit {

namespace {

std::map<KeyTuple, Row> index_by_key(const std::vector<Row>& rows,
                                     const std::vector<std::string>& key_columns) {
  std::map<KeyTuple, Row> by_key;
  for (const auto& row : rows) {
    by_key[key_of(row, key_columns)] = row;
  }
  return by_key;
}

} // namespace

TableDiff diff_tables(const std::vector<Row>& original, const std::vector<Row>& edited,
                      const std::vector<std::string>& key_columns) {
  auto orig_by_key = index_by_key(original, key_columns);
  auto edited_by_key = index_by_key(edited, key_columns);

  TableDiff diff;
  for (const auto& [key, row] : edited_by_key) {
    auto it = orig_by_key.find(key);
    if (it == orig_by_key.end()) {
      diff.added.push_back(row);
    } else if (it->second != row) {
      diff.modified.emplace_back(it->second, row);
    }
  }
  for (const auto& [key, row] : orig_by_key) {
    if (edited_by_key.count(key) == 0) {
      diff.removed.push_back(row);
    }
  }
  return diff;
}

} // namespace tabedit
