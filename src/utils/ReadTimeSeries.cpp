#include "utils/ReadTimeSeries.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ionbench {

Eigen::VectorXd readVectorFromCSV(const std::string& filename, int expected_rows) {
    const std::string funcName = "ionbench::readVectorFromCSV";
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw CSVReadException(CSVReadException::ErrorType::FileOpenError, funcName, filename);
    }

    std::vector<double> values;
    std::string line;
    line.reserve(256);
    std::string cell;
    cell.reserve(32);
    int row = 0;

    while (std::getline(file, line)) {
        ++row;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.compare(0, 2, "//") == 0) {
            continue;
        }

        std::stringstream ss(line);
        if (!std::getline(ss, cell, ',') || cell.find_first_not_of(" \t") == std::string::npos) {
            throw CSVReadException(CSVReadException::ErrorType::NotEnoughColumns, funcName,
                "row " + std::to_string(row) + " in " + filename);
        }

        double value = 0.0;
        try {
            std::size_t consumed = 0;
            value = std::stod(cell, &consumed);
            if (cell.find_first_not_of(" \t", consumed) != std::string::npos) {
                throw std::invalid_argument(cell);
            }
        } catch (const std::invalid_argument&) {
            throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                "row " + std::to_string(row) + ": '" + cell + "' in " + filename);
        } catch (const std::out_of_range&) {
            throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                "Number out of range at row " + std::to_string(row) + ": '" + cell + "' in " + filename);
        }
        if (!std::isfinite(value)) {
            throw CSVReadException(CSVReadException::ErrorType::NonFiniteValue, funcName,
                "row " + std::to_string(row) + " in " + filename);
        }
        values.push_back(value);
    }

    if (values.empty()) {
        throw CSVReadException(CSVReadException::ErrorType::NoDataRows, funcName, "No data rows found in file: " + filename);
    }
    if (expected_rows >= 0 && static_cast<int>(values.size()) != expected_rows) {
        throw CSVReadException(CSVReadException::ErrorType::NoDataRows, funcName,
            "expected " + std::to_string(expected_rows) + " rows, found " + std::to_string(values.size()) + " in " + filename);
    }

    return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

} // namespace ionbench
