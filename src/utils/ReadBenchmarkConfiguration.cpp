#include "utils/ReadBenchmarkConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ionbench {

namespace {

void trim(std::string& line) {
    line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
    line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);
}

// std::stod rather than operator>> so that inf and -inf are accepted.
bool parseNumber(const std::string& token, double& value) {
    try {
        std::size_t consumed = 0;
        value = std::stod(token, &consumed);
        return consumed == token.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // anonymous namespace

std::map<std::string, double> readSettingsFile(const std::string& filename, const std::string& calling_function_name) {
    const std::string source = "ReadBenchmarkConfiguration::" + calling_function_name;
    std::map<std::string, double> settings;
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::getInstance().error(source, "Error opening settings file: " + filename);
        throw FileIOException(calling_function_name, "Error opening settings file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> tokens = tokenize(line);
        double value = 0.0;
        if (tokens.size() < 2 || !parseNumber(tokens[1], value)) {
            Logger::getInstance().error(source, "Invalid line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw DataFormatException(calling_function_name, "Invalid line in settings file: " + line);
        }
        if (tokens.size() > 2) {
            Logger::getInstance().error(source, "Too many values on line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw DataFormatException(calling_function_name, "Too many values on line in settings file: " + line);
        }
        settings[tokens[0]] = value;
    }
    Logger::getInstance().info(source, "Successfully read " + std::to_string(settings.size()) + " settings from " + filename);
    return settings;
}

std::map<std::string, double> readBenchmarkSettings(const std::string& filename) {
    return readSettingsFile(filename, "readBenchmarkSettings");
}

std::map<std::string, double> readOptimiserSettings(const std::string& filename) {
    return readSettingsFile(filename, "readOptimiserSettings");
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> readParamBounds(const std::string& filename, int num_parameters) {
    const std::string source = "ReadBenchmarkConfiguration::readParamBounds";
    if (num_parameters <= 0) {
        THROW_INVALID_PARAM("readParamBounds", "Number of parameters must be positive.");
    }
    const double inf = std::numeric_limits<double>::infinity();
    Eigen::VectorXd lower = Eigen::VectorXd::Constant(num_parameters, -inf);
    Eigen::VectorXd upper = Eigen::VectorXd::Constant(num_parameters, inf);

    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::getInstance().error(source, "Error opening param bounds file: " + filename);
        throw FileIOException("readParamBounds", "Error opening param bounds file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> tokens = tokenize(line);
        double index_value = 0.0, low = 0.0, high = 0.0;
        if (tokens.size() != 3 || !parseNumber(tokens[0], index_value) ||
            !parseNumber(tokens[1], low) || !parseNumber(tokens[2], high)) {
            Logger::getInstance().error(source, "Invalid line in bounds file (line " + std::to_string(line_number) + "): " + line);
            throw DataFormatException("readParamBounds", "Invalid line in bounds file: " + line);
        }
        const int index = static_cast<int>(index_value);
        if (index_value != index || index < 0 || index >= num_parameters) {
            throw DataFormatException("readParamBounds",
                "Parameter index " + tokens[0] + " out of range on line " + std::to_string(line_number));
        }
        if (std::isnan(low) || std::isnan(high) || low > high) {
            throw DataFormatException("readParamBounds",
                "Invalid bounds for parameter " + std::to_string(index) + " on line " + std::to_string(line_number));
        }
        lower[index] = low;
        upper[index] = high;
    }
    return {lower, upper};
}

} // namespace ionbench
