/**
 * @file table.hpp
 * @brief Nullable values and the column-store attribute table
 * @author Tidemark Team
 * @version 0.1.0
 * @date 2026
 *
 * The AttributeTable is the tabular half of every dataset in Tidemark:
 * the exposure table itself, the attributes attached to a geometry layer,
 * and the cost, linking and curve tables read by the providers.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tidemark {

// ============================================================================
// Values
// ============================================================================

/// A single nullable cell. std::monostate is null.
using Value = std::variant<std::monostate, int64_t, double, std::string>;

/// Column data, one value per row
using ValueColumn = std::vector<Value>;

/**
 * @brief Check if a value is null (monostate or NaN)
 */
[[nodiscard]] bool is_null(const Value& value);

/**
 * @brief Read a value as a number
 * @return The number, or nullopt for null and non-numeric strings
 *
 * Numeric strings ("2", " 3.5 ") are parsed so that tables read from CSV
 * behave like typed tables.
 */
[[nodiscard]] std::optional<double> as_number(const Value& value);

/**
 * @brief Read a value as an integer (numbers are truncated)
 */
[[nodiscard]] std::optional<int64_t> as_integer(const Value& value);

/**
 * @brief Read a value as a string key
 * @return The string form, or nullopt for null
 *
 * Integral doubles are printed without a fractional part, so 2.0 and 2
 * produce the same key "2".
 */
[[nodiscard]] std::optional<std::string> as_string(const Value& value);

/**
 * @brief Human readable form of a value for logs ("null" for null)
 */
[[nodiscard]] std::string to_display(const Value& value);

// ============================================================================
// Attribute Table
// ============================================================================

/**
 * @brief Ordered set of named, equally sized columns
 *
 * Columns keep their insertion order. A table created with a row count
 * but no columns still reports that row count, which lets callers build a
 * table column by column.
 */
class AttributeTable {
public:
    AttributeTable() = default;
    explicit AttributeTable(size_t rows) : m_rows(rows) {}

    /// @name Shape
    /// @{
    [[nodiscard]] size_t row_count() const { return m_rows; }
    [[nodiscard]] size_t column_count() const { return m_order.size(); }
    [[nodiscard]] bool empty() const { return m_rows == 0; }
    [[nodiscard]] const std::vector<std::string>& column_names() const { return m_order; }
    /// @}

    /// @name Column access
    /// @{
    [[nodiscard]] bool has_column(const std::string& name) const;

    /**
     * @brief Get a column by name
     * @throws MissingColumnError if the column does not exist
     */
    [[nodiscard]] const ValueColumn& column(const std::string& name) const;
    [[nodiscard]] ValueColumn& column(const std::string& name);

    /**
     * @brief Get a single cell
     * @throws MissingColumnError if the column does not exist
     */
    [[nodiscard]] const Value& at(const std::string& name, size_t row) const;

    /**
     * @brief Column names starting with a prefix, in table order
     */
    [[nodiscard]] std::vector<std::string> columns_with_prefix(const std::string& prefix) const;
    /// @}

    /// @name Column modification
    /// @{

    /**
     * @brief Insert or replace a column
     * @throws UserInputError if the size does not match the row count
     *
     * A table without columns adopts the size of its first column.
     */
    void set_column(const std::string& name, ValueColumn values);

    /**
     * @brief Insert a column filled with one value (replaces if present)
     */
    void fill_column(const std::string& name, const Value& value);

    /**
     * @brief Make sure a column exists, creating it null-filled if absent
     */
    void ensure_column(const std::string& name);

    /**
     * @brief Remove a column (no-op when absent)
     */
    void drop_column(const std::string& name);

    /**
     * @brief Rename a column
     * @throws MissingColumnError if the column does not exist
     */
    void rename_column(const std::string& from, const std::string& to);
    /// @}

    /// @name Row operations
    /// @{

    /**
     * @brief New table containing the given rows in the given order
     */
    [[nodiscard]] AttributeTable select_rows(const std::vector<size_t>& rows) const;

    /**
     * @brief Append the rows of another table
     *
     * The result holds the union of both column sets; cells of columns
     * missing on one side are null.
     */
    void append_rows(const AttributeTable& other);
    /// @}

    /**
     * @brief Check that every named column exists
     * @param names Columns that must be present
     * @param step Name of the operation, used in the error message
     * @throws MissingColumnError naming the first missing column
     */
    void require_columns(const std::vector<std::string>& names, const std::string& step) const;

private:
    std::vector<std::string> m_order;
    std::unordered_map<std::string, ValueColumn> m_columns;
    size_t m_rows = 0;
};

} // namespace tidemark
