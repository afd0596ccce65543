#ifndef READ_TIME_SERIES_HPP
#define READ_TIME_SERIES_HPP

#include <Eigen/Dense>
#include <string>
#include "exceptions/CSVReadException.hpp"

namespace ionbench {
/**
 * @brief Reads a column of reference data from a CSV file
 *
 * The first field of every row is read; further fields are ignored. Blank lines and
 * lines starting with "//" are skipped.
 *
 * @param filename [std::string] The path to the CSV file to read
 * @param expected_rows [int] Number of rows required, or -1 to accept any non-zero number
 *
 * @return Eigen::VectorXd The values, in file order
 *
 * @throws CSVReadException::FileOpenError If the file cannot be opened
 * @throws CSVReadException::NoDataRows If the file holds no data, or not the expected number of rows
 * @throws CSVReadException::NotEnoughColumns If a row has an empty first field
 * @throws CSVReadException::InvalidNumberFormat If a field is not a number
 * @throws CSVReadException::NonFiniteValue If a value is NaN or infinite
 */
Eigen::VectorXd readVectorFromCSV(const std::string& filename, int expected_rows = -1);
} // namespace ionbench
#endif // READ_TIME_SERIES_HPP
