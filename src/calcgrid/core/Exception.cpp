/**
 * @file Exception.cpp
 * @brief CalcGrid异常类实现
 */

#include "Exception.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include <sstream>
#include <fmt/format.h>

namespace calcgrid {
namespace core {

// CalcGridException 实现
CalcGridException::CalcGridException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string CalcGridException::getErrorCodeString() const {
    switch (error_code_) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::InvalidCellReference: return "InvalidCellReference";
        case ErrorCode::InvalidRange: return "InvalidRange";
        case ErrorCode::InvalidFormula: return "InvalidFormula";
        case ErrorCode::InvalidFunction: return "InvalidFunction";
        case ErrorCode::DivisionByZero: return "DivisionByZero";
        case ErrorCode::CircularReference: return "CircularReference";
        default: return "Unknown";
    }
}

std::string CalcGridException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void CalcGridException::addContext(const std::string& context) {
    context_.push_back(context);
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : CalcGridException(parameter_name.empty()
                            ? message
                            : fmt::format("{} (parameter: {})", message, parameter_name),
                        ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// CellException 实现
CellException::CellException(const std::string& message,
                             int row, int col, ErrorCode code,
                             const char* file, int line)
    : CalcGridException(message, code, file, line)
    , row_(row)
    , col_(col) {
}

std::string CellException::getCellReference() const {
    if (row_ < 0 || col_ < 0) {
        return "Unknown";
    }
    return utils::AddressParser::encode(row_, col_);
}

// FormulaException 实现
FormulaException::FormulaException(const std::string& message,
                                   ErrorCode code,
                                   const std::string& formula,
                                   const char* file, int line)
    : CalcGridException(formula.empty()
                            ? message
                            : fmt::format("{} (formula: {})", message, formula),
                        code, file, line)
    , formula_(formula) {
}

// Result -> 异常 的映射，供 Expected::valueOrThrow 使用
void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.fullMessage());

        case ErrorCode::InvalidCellReference:
        case ErrorCode::InvalidRange:
            throw CellException(error.fullMessage(), -1, -1, error.code);

        case ErrorCode::InvalidFormula:
        case ErrorCode::InvalidFunction:
        case ErrorCode::DivisionByZero:
        case ErrorCode::CircularReference:
            throw FormulaException(error.message, error.code, error.context);

        default:
            throw CalcGridException(error.fullMessage(), error.code);
    }
}

} // namespace core
} // namespace calcgrid
