#include "calcgrid/core/CellAddress.hpp"
#include "calcgrid/utils/AddressParser.hpp"

namespace calcgrid {
namespace core {

std::string CellPosition::toString() const {
    if (!isValid()) {
        return "Invalid";
    }
    return utils::AddressParser::encode(row, col);
}

std::string CellRange::toString() const {
    return utils::AddressParser::encodeRange(*this);
}

}} // namespace calcgrid::core
