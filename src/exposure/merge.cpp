#include "exposure/merge.hpp"
#include <spdlog/spdlog.h>

namespace tidemark::exposure {

AttributeTable merge_attribute(AttributeTable table,
                               const std::string& target,
                               const std::string& source) {
    table.require_columns({source}, "merge into '" + target + "'");
    if (target == source) return table;

    table.ensure_column(target);

    const ValueColumn& incoming = table.column(source);
    ValueColumn& current = table.column(target);

    size_t updated = 0;
    for (size_t row = 0; row < incoming.size(); ++row) {
        if (!is_null(incoming[row])) {
            current[row] = incoming[row];
            ++updated;
        }
    }

    table.drop_column(source);
    spdlog::debug("Merge: {} of {} rows of '{}' updated", updated, table.row_count(), target);
    return table;
}

} // namespace tidemark::exposure
