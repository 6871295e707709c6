#include "core/report.hpp"
#include "core/columns.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>

namespace tidemark {

std::string sample_ids(const std::vector<int64_t>& ids, size_t count) {
    if (ids.empty()) return "none";

    size_t shown = std::min(count, ids.size());
    std::vector<int64_t> head(ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(shown));
    std::string text = fmt::format("{}", fmt::join(head, ", "));
    if (ids.size() > shown) {
        text += fmt::format(" (+{} more)", ids.size() - shown);
    }
    return text;
}

std::string sample_values(const std::set<std::string>& values, size_t count) {
    if (values.empty()) return "none";

    std::vector<std::string> head;
    for (const auto& value : values) {
        if (head.size() == count) break;
        head.push_back("'" + value + "'");
    }
    std::string text = fmt::format("{}", fmt::join(head, ", "));
    if (values.size() > head.size()) {
        text += fmt::format(" (+{} more)", values.size() - head.size());
    }
    return text;
}

std::vector<int64_t> ids_of_rows(const AttributeTable& table, const std::vector<size_t>& rows) {
    std::vector<int64_t> ids;
    if (!table.has_column(columns::OBJECT_ID)) return ids;

    const auto& column = table.column(columns::OBJECT_ID);
    ids.reserve(rows.size());
    for (size_t row : rows) {
        if (auto id = as_integer(column.at(row))) {
            ids.push_back(*id);
        }
    }
    return ids;
}

} // namespace tidemark
