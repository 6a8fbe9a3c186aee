#ifndef TABEDIT_TABLE_DIFF_H
#define TABEDIT_TABLE_DIFF_H

#include "tabedit/table.h"

#include <string>
#include <utility>
#include <vector>

namespace tabedit {

/// Rows that differ between an original and an edited row set.
struct TableDiff {
  std::vector<Row> added;                        ///< Only in the edited rows
  std::vector<Row> removed;                      ///< Only in the original rows
  std::vector<std::pair<Row, Row>> modified;     ///< (original, edited), same key

  bool empty() const { return added.empty() && removed.empty() && modified.empty(); }
};

/// Match rows by key and classify them as added, removed or modified.
///
/// Within one side a repeated key keeps the last row. Each output list is
/// ordered by key tuple.
TableDiff diff_tables(const std::vector<Row>& original, const std::vector<Row>& edited,
                      const std::vector<std::string>& key_columns);

} // namespace tabedit

#endif // TABEDIT_TABLE_DIFF_H
