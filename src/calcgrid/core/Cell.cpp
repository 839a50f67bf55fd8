#include "calcgrid/core/Cell.hpp"

namespace calcgrid {
namespace core {

void Cell::clear() {
    input_.clear();
    display_value_.clear();
    has_error_ = false;
    error_code_ = ErrorCode::Ok;
}

std::string Cell::getFormulaBody(char marker) const {
    if (!isFormula(marker)) {
        return std::string();
    }
    return input_.substr(1);
}

}} // namespace calcgrid::core
