#include "table.h++"
#include <set>

using std::optional, std::string, std::string_view, std::vector;

namespace Stowage {
  auto column_type_name(ColumnType type) noexcept -> string_view {
    switch (type) {
      case ColumnType::Integer: return "integer";
      case ColumnType::Real: return "real";
      case ColumnType::Text: return "text";
      case ColumnType::Boolean: return "boolean";
    }
    return "unknown";
  }

  auto column_type_from_name(string_view name) -> optional<ColumnType> {
    const auto lower = to_ascii_lowercase(name);
    if (lower == "integer" || lower == "int" || lower == "bigint") return ColumnType::Integer;
    if (lower == "real" || lower == "double") return ColumnType::Real;
    if (lower == "text" || lower == "string") return ColumnType::Text;
    if (lower == "boolean" || lower == "bool") return ColumnType::Boolean;
    return {};
  }

  auto value_to_string(const Value& value) -> string {
    return std::visit(overload{
      [](std::monostate) { return string("NULL"); },
      [](int64_t i) { return std::to_string(i); },
      [](double d) { return fmt::format("{}", d); },
      [](bool b) { return string(b ? "true" : "false"); },
      [](const string& s) { return s; }
    }, value);
  }

  static inline auto value_matches(const Value& value, ColumnType type) noexcept -> bool {
    switch (type) {
      case ColumnType::Integer: return std::holds_alternative<int64_t>(value);
      case ColumnType::Real: return std::holds_alternative<double>(value);
      case ColumnType::Text: return std::holds_alternative<string>(value);
      case ColumnType::Boolean: return std::holds_alternative<bool>(value);
    }
    return false;
  }

  Table::Table(string type_name, string name, vector<Column> columns)
    : _type_name(std::move(type_name)), _name(std::move(name)), _columns(std::move(columns)) {
    if (!is_qualified_name(_type_name)) {
      throw StowageError(fmt::format("Invalid record type name '{}'", _type_name));
    }
    if (_name.empty()) throw StowageError(fmt::format("Table for {} has no name", _type_name));
    std::set<string_view> seen;
    bool has_key = false;
    for (const auto& col : _columns) {
      if (col.name.empty()) throw StowageError(fmt::format("Table {} has an unnamed column", _name));
      if (!seen.insert(col.name).second) {
        throw StowageError(fmt::format("Table {} has duplicate column {}", _name, col.name));
      }
      if (col.primary_key) {
        if (has_key) throw StowageError(fmt::format("Table {} has more than one primary key", _name));
        has_key = true;
      }
    }
  }

  auto Table::primary_key_index() const noexcept -> optional<size_t> {
    for (size_t i = 0; i < _columns.size(); i++) {
      if (_columns[i].primary_key) return i;
    }
    return {};
  }

  auto Table::check_row(const Row& row) const -> void {
    if (row.size() != _columns.size()) {
      throw RowShapeError(fmt::format(
        "Row for table {} has {:d} values, expected {:d}", _name, row.size(), _columns.size()
      ));
    }
    for (size_t i = 0; i < row.size(); i++) {
      const auto& col = _columns[i];
      if (std::holds_alternative<std::monostate>(row[i])) {
        if (!col.nullable || col.primary_key) {
          throw RowShapeError(fmt::format("Column {}.{} cannot be NULL", _name, col.name));
        }
      } else if (!value_matches(row[i], col.type)) {
        throw RowShapeError(fmt::format(
          "Column {}.{} expects {}, got {}", _name, col.name, column_type_name(col.type), value_to_string(row[i])
        ));
      }
    }
  }
}
