#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace transit::io {

// Source tables are handed out one at a time so the assembler never holds
// more than one batch in memory.
class ITableSource {
public:
  virtual ~ITableSource() = default;
  virtual std::size_t Count() const = 0;
  // Throws SourceReadError when table `index` cannot be read.
  virtual RawTable Load(std::size_t index) = 0;
};

// Hands each table over on Load(); a second Load() of the same index yields
// an emptied table.
class InMemoryTableSource final : public ITableSource {
public:
  explicit InMemoryTableSource(std::vector<RawTable> tables) : tables_(std::move(tables)) {}

  std::size_t Count() const override { return tables_.size(); }
  RawTable Load(std::size_t index) override { return std::move(tables_.at(index)); }

private:
  std::vector<RawTable> tables_;
};

// One CSV file per table, read on Load().
class CsvTableSource final : public ITableSource {
public:
  explicit CsvTableSource(std::vector<std::string> paths) : paths_(std::move(paths)) {}

  std::size_t Count() const override { return paths_.size(); }
  RawTable Load(std::size_t index) override;

private:
  std::vector<std::string> paths_;
};

} // namespace transit::io
