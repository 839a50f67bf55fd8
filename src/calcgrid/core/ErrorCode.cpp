#include "calcgrid/core/ErrorCode.hpp"

namespace calcgrid {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 引用错误
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::InvalidRange:
            return "Invalid range";

        // 公式错误
        case ErrorCode::InvalidFormula:
            return "Invalid formula";
        case ErrorCode::InvalidFunction:
            return "Invalid function";
        case ErrorCode::DivisionByZero:
            return "Division by zero";

        // 网格错误
        case ErrorCode::CircularReference:
            return "Circular reference";

        default:
            return "Unknown error";
    }
}

}} // namespace calcgrid::core
