#include "types/symbol.hpp"

namespace memscope::types {

auto denotation_to_string(const Denotation& denot) -> std::string {
    if (!denot.symbol)
        return "<no symbol>";
    if (is_absent(denot.info))
        return denot.symbol->name;
    return denot.symbol->name + ": " + type_to_string(denot.info);
}

} // namespace memscope::types
