#include "exceptions/CSVReadException.hpp"

namespace ionbench {

CSVReadException::CSVReadException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, details.empty() ? std::string(describe(type))
                                                        : std::string(describe(type)) + ": " + details),
      errorType_(type) {}

const char* CSVReadException::describe(ErrorType type) {
    switch (type) {
        case ErrorType::FileOpenError:       return "Could not open data file";
        case ErrorType::NoDataRows:          return "Not enough data rows";
        case ErrorType::NotEnoughColumns:    return "Empty data field";
        case ErrorType::InvalidNumberFormat: return "Invalid number format";
        case ErrorType::NonFiniteValue:      return "Non-finite data value";
    }
    return "Unknown CSV error";
}

} // namespace ionbench
