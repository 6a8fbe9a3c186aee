#include <benchmark/benchmark.h>

#include "tabedit/table_diff.h"
#include "tabedit/table_parser.h"
#include "tabedit/validator.h"
#include "tabedit/writer.h"

#include <random>
#include <string>

namespace {

// Synthetic table: an id column plus text columns, some needing quotes
tabedit::Table make_table(size_t nrows, size_t ncols, bool tricky) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> len(1, 16);
  std::uniform_int_distribution<int> letter('a', 'z');

  tabedit::Table table;
  table.columns.push_back("id");
  for (size_t c = 1; c < ncols; ++c) {
    table.columns.push_back("col" + std::to_string(c));
  }

  for (size_t r = 0; r < nrows; ++r) {
    tabedit::Row row;
    row["id"] = std::to_string(r);
    for (size_t c = 1; c < ncols; ++c) {
      std::string value;
      int n = len(rng);
      for (int i = 0; i < n; ++i) {
        value += static_cast<char>(letter(rng));
      }
      if (tricky && (r + c) % 4 == 0) {
        value += (r % 2 == 0) ? "\t\"quoted\"" : "\nsecond line";
      }
      row[table.columns[c]] = value;
    }
    table.rows.push_back(std::move(row));
  }
  return table;
}

} // namespace

static void BM_WriteTable(benchmark::State& state) {
  tabedit::Table table = make_table(static_cast<size_t>(state.range(0)), 8, state.range(1) != 0);
  tabedit::WriteOptions opts;

  size_t bytes = 0;
  for (auto _ : state) {
    std::string text = tabedit::write_table(table, opts);
    bytes = text.size();
    benchmark::DoNotOptimize(text);
  }

  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
  state.counters["Rows"] = static_cast<double>(table.rows.size());
}
BENCHMARK(BM_WriteTable)
    ->ArgsProduct({{100, 1000, 10000}, {0, 1}})
    ->Unit(benchmark::kMillisecond);

static void BM_WriteTableUnaligned(benchmark::State& state) {
  tabedit::Table table = make_table(static_cast<size_t>(state.range(0)), 8, true);
  tabedit::WriteOptions opts;
  opts.align_columns = false;

  for (auto _ : state) {
    std::string text = tabedit::write_table(table, opts);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_WriteTableUnaligned)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

static void BM_ParseTable(benchmark::State& state) {
  std::string text = tabedit::write_table(
      make_table(static_cast<size_t>(state.range(0)), 8, state.range(1) != 0));

  for (auto _ : state) {
    auto result = tabedit::parse_table(text);
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(static_cast<int64_t>(text.size() * state.iterations()));
}
BENCHMARK(BM_ParseTable)
    ->ArgsProduct({{100, 1000, 10000}, {0, 1}})
    ->Unit(benchmark::kMillisecond);

static void BM_Validate(benchmark::State& state) {
  tabedit::Table table = make_table(static_cast<size_t>(state.range(0)), 8, false);
  tabedit::ValidationOptions opts;
  opts.required_columns = std::vector<std::string>{"id", "col1"};
  opts.key_columns = std::vector<std::string>{"id"};
  opts.column_types = {{"id", tabedit::ColumnType::integer()}};

  for (auto _ : state) {
    auto errors = tabedit::validate(table.columns, table.rows, opts);
    benchmark::DoNotOptimize(errors);
  }
}
BENCHMARK(BM_Validate)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

static void BM_DiffTables(benchmark::State& state) {
  tabedit::Table original = make_table(static_cast<size_t>(state.range(0)), 8, false);
  tabedit::Table edited = original;
  for (size_t i = 0; i < edited.rows.size(); i += 10) {
    edited.rows[i]["col1"] = "changed";
  }

  for (auto _ : state) {
    auto diff = tabedit::diff_tables(original.rows, edited.rows, {"id"});
    benchmark::DoNotOptimize(diff);
  }
}
BENCHMARK(BM_DiffTables)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
