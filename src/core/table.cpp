/**
 * @file table.cpp
 * @brief Implementation of values and the attribute table
 */

#include "core/table.hpp"
#include "core/errors.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace tidemark {

// ============================================================================
// Values
// ============================================================================

namespace {

std::optional<double> parse_number(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    auto end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(begin, end - begin + 1);

    errno = 0;
    char* parse_end = nullptr;
    double result = std::strtod(trimmed.c_str(), &parse_end);
    if (errno != 0 || parse_end != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }
    if (std::isnan(result)) return std::nullopt;
    return result;
}

} // namespace

bool is_null(const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) return true;
    if (const auto* d = std::get_if<double>(&value)) return std::isnan(*d);
    return false;
}

std::optional<double> as_number(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isnan(*d)) return std::nullopt;
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&value)) return parse_number(*s);
    return std::nullopt;
}

std::optional<int64_t> as_integer(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    auto number = as_number(value);
    if (!number || !std::isfinite(*number)) return std::nullopt;
    return static_cast<int64_t>(*number);
}

std::optional<std::string> as_string(const Value& value) {
    if (is_null(value)) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);

    double d = std::get<double>(value);
    if (std::isfinite(d) && std::floor(d) == d && std::abs(d) < 9.0e15) {
        return std::to_string(static_cast<int64_t>(d));
    }
    return fmt::format("{}", d);
}

std::string to_display(const Value& value) {
    auto text = as_string(value);
    return text ? *text : std::string("null");
}

// ============================================================================
// AttributeTable
// ============================================================================

bool AttributeTable::has_column(const std::string& name) const {
    return m_columns.count(name) > 0;
}

const ValueColumn& AttributeTable::column(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) throw MissingColumnError(name, "");
    return it->second;
}

ValueColumn& AttributeTable::column(const std::string& name) {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) throw MissingColumnError(name, "");
    return it->second;
}

const Value& AttributeTable::at(const std::string& name, size_t row) const {
    return column(name).at(row);
}

std::vector<std::string> AttributeTable::columns_with_prefix(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& name : m_order) {
        if (name.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(name);
        }
    }
    return result;
}

void AttributeTable::set_column(const std::string& name, ValueColumn values) {
    if (m_order.empty() && m_rows == 0) {
        m_rows = values.size();
    }
    if (values.size() != m_rows) {
        throw UserInputError(fmt::format(
            "Column '{}' has {} values but the table has {} rows",
            name, values.size(), m_rows));
    }
    if (!has_column(name)) {
        m_order.push_back(name);
    }
    m_columns[name] = std::move(values);
}

void AttributeTable::fill_column(const std::string& name, const Value& value) {
    set_column(name, ValueColumn(m_rows, value));
}

void AttributeTable::ensure_column(const std::string& name) {
    if (!has_column(name)) {
        fill_column(name, Value{});
    }
}

void AttributeTable::drop_column(const std::string& name) {
    if (m_columns.erase(name) == 0) return;
    m_order.erase(std::remove(m_order.begin(), m_order.end(), name), m_order.end());
}

void AttributeTable::rename_column(const std::string& from, const std::string& to) {
    if (from == to) return;
    ValueColumn values = std::move(column(from));
    drop_column(from);
    drop_column(to);
    m_order.push_back(to);
    m_columns[to] = std::move(values);
}

AttributeTable AttributeTable::select_rows(const std::vector<size_t>& rows) const {
    AttributeTable result(rows.size());
    for (const auto& name : m_order) {
        const auto& source = m_columns.at(name);
        ValueColumn values;
        values.reserve(rows.size());
        for (size_t row : rows) {
            values.push_back(source.at(row));
        }
        result.set_column(name, std::move(values));
    }
    return result;
}

void AttributeTable::append_rows(const AttributeTable& other) {
    size_t new_rows = m_rows + other.m_rows;

    for (const auto& name : m_order) {
        auto& values = m_columns[name];
        if (other.has_column(name)) {
            const auto& extra = other.m_columns.at(name);
            values.insert(values.end(), extra.begin(), extra.end());
        } else {
            values.resize(new_rows);
        }
    }

    for (const auto& name : other.m_order) {
        if (has_column(name)) continue;
        ValueColumn values(m_rows);
        const auto& extra = other.m_columns.at(name);
        values.insert(values.end(), extra.begin(), extra.end());
        m_order.push_back(name);
        m_columns[name] = std::move(values);
    }

    m_rows = new_rows;
}

void AttributeTable::require_columns(const std::vector<std::string>& names,
                                     const std::string& step) const {
    for (const auto& name : names) {
        if (!has_column(name)) {
            throw MissingColumnError(name, step);
        }
    }
}

} // namespace tidemark
