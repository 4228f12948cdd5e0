#include "io/csv_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include "common/errors.hpp"
#include "io/table_source.hpp"

namespace fs = std::filesystem;

namespace transit::io {

namespace {

std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw SourceReadError("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

bool IsBlank(const std::vector<std::string>& record) {
  return record.size() == 1 && record[0].empty();
}

} // namespace

RawTable ParseCsv(const std::string& text, const std::string& name) {
  RawTable table;
  table.name = name;

  std::size_t i = 0;
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool any = false; // current record has content

  auto end_field = [&]() {
    record.push_back(std::move(field));
    field.clear();
  };
  auto end_record = [&]() {
    end_field();
    if (!IsBlank(record)) records.push_back(std::move(record));
    record.clear();
    any = false;
  };

  for (; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }

    switch (ch) {
      case '"':
        in_quotes = true;
        any = true;
        break;
      case ',':
        end_field();
        any = true;
        break;
      case '\r':
        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        end_record();
        break;
      case '\n':
        end_record();
        break;
      default:
        field.push_back(ch);
        any = true;
        break;
    }
  }
  if (any || !field.empty()) end_record();

  if (records.empty()) return table;

  table.columns = std::move(records.front());
  for (auto& c : table.columns) {
    // header cells are matched by exact name later
    while (!c.empty() && (c.back() == ' ' || c.back() == '\t')) c.pop_back();
    while (!c.empty() && (c.front() == ' ' || c.front() == '\t')) c.erase(c.begin());
  }
  table.rows.assign(std::make_move_iterator(records.begin() + 1),
                    std::make_move_iterator(records.end()));
  return table;
}

RawTable ReadCsvTable(const std::string& path) {
  const fs::path p(path);
  return ParseCsv(ReadAllText(p), p.filename().string());
}

RawTable CsvTableSource::Load(std::size_t index) {
  if (index >= paths_.size()) {
    throw SourceReadError("table index out of range: " + std::to_string(index));
  }
  return ReadCsvTable(paths_[index]);
}

} // namespace transit::io
