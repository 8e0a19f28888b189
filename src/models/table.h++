#pragma once
#include "util/errors.h++"
#include <variant>

namespace Stowage {
  enum class ColumnType : uint8_t {
    Integer,
    Real,
    Text,
    Boolean
  };

  auto column_type_name(ColumnType type) noexcept -> std::string_view;
  auto column_type_from_name(std::string_view name) -> std::optional<ColumnType>;

  // std::monostate is NULL
  using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;
  using Row = std::vector<Value>;

  auto value_to_string(const Value& value) -> std::string;

  struct Column {
    std::string name;
    ColumnType type;
    bool primary_key = false;
    bool nullable = true;
  };

  // Describes one persisted record type. Two tables are the same table iff
  // they describe the same record type.
  class Table {
  private:
    std::string _type_name, _name;
    std::vector<Column> _columns;
  public:
    Table(std::string type_name, std::string name, std::vector<Column> columns);

    auto type_name() const noexcept -> const std::string& { return _type_name; }
    auto name() const noexcept -> const std::string& { return _name; }
    auto columns() const noexcept -> const std::vector<Column>& { return _columns; }
    auto primary_key_index() const noexcept -> std::optional<size_t>;

    auto check_row(const Row& row) const -> void;

    auto operator==(const Table& other) const noexcept -> bool {
      return _type_name == other._type_name;
    }
  };

  // Specialize for each record struct that maps to a table:
  //   static auto table() -> const Table&;
  //   static auto to_row(const T&) -> Row;
  //   static auto from_row(const Row&) -> T;
  template <typename T> struct RecordTraits;

  template <typename T> static inline auto row_get(const Row& row, size_t i) -> const T& {
    if (i >= row.size()) throw RowShapeError(fmt::format("Row has no column {:d}", i));
    if (auto* v = std::get_if<T>(&row[i])) return *v;
    throw RowShapeError(fmt::format("Unexpected value type in column {:d}", i));
  }

  template <typename T> static inline auto row_get_opt(const Row& row, size_t i) -> std::optional<T> {
    if (i >= row.size()) throw RowShapeError(fmt::format("Row has no column {:d}", i));
    if (std::holds_alternative<std::monostate>(row[i])) return {};
    return row_get<T>(row, i);
  }
}
