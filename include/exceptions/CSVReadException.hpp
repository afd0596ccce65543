#ifndef CSV_READ_EXCEPTION_HPP
#define CSV_READ_EXCEPTION_HPP

#include "exceptions/Exceptions.hpp"
#include <string>

namespace ionbench {

/**
 * @brief Failure while reading a reference data column.
 */
class CSVReadException : public DataFormatException {
public:
    enum class ErrorType {
        FileOpenError,
        NoDataRows,          ///< No rows, or not the expected number of rows.
        NotEnoughColumns,    ///< Row with an empty first field.
        InvalidNumberFormat,
        NonFiniteValue
    };

    CSVReadException(ErrorType type, const std::string& functionName, const std::string& details);

    ErrorType getErrorType() const { return errorType_; }

    /** @brief Short label for @p type, used as the message prefix. */
    static const char* describe(ErrorType type);

private:
    ErrorType errorType_;
};

} // namespace ionbench

#endif // CSV_READ_EXCEPTION_HPP
