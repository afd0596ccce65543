#ifndef READ_BENCHMARK_CONFIGURATION_HPP
#define READ_BENCHMARK_CONFIGURATION_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <utility>

namespace ionbench {

/**
 * @brief Reads a settings file.
 *
 * Each non-empty line in the file should contain:
 * <setting_name> <value>
 * Lines starting with '#' are ignored. Values may be written as inf or -inf.
 *
 * @param filename Path to the settings file.
 * @param calling_function_name Name used in log messages and exceptions.
 * @return std::map<std::string, double> Map of setting names to values.
 *
 * @throws FileIOException If the file cannot be opened.
 * @throws DataFormatException If a line is formatted incorrectly.
 */
std::map<std::string, double> readSettingsFile(const std::string& filename,
                                               const std::string& calling_function_name = "readSettingsFile");

/**
 * @brief Reads benchmark problem settings (parameter_space_width, cost_threshold,
 *        use_scale_factors, log_transform, bounded, rate_bounded, ...).
 */
std::map<std::string, double> readBenchmarkSettings(const std::string& filename);

/**
 * @brief Reads optimiser settings, handed unchanged to IOptimisationAlgorithm::configure.
 */
std::map<std::string, double> readOptimiserSettings(const std::string& filename);

/**
 * @brief Reads absolute parameter bounds from a text file.
 *
 * Each non-empty line in the file should contain:
 * <param_index> <lower_bound> <upper_bound>
 * Lines starting with '#' are ignored. Indices are zero-based; parameters without a
 * line are unbounded (-inf, inf).
 *
 * @param filename Path to the parameter bounds file.
 * @param num_parameters Number of model parameters.
 * @return (lower, upper) bound vectors in original space.
 *
 * @throws FileIOException If the file cannot be opened.
 * @throws DataFormatException If a line is malformed, an index is out of range or lower > upper.
 */
std::pair<Eigen::VectorXd, Eigen::VectorXd> readParamBounds(const std::string& filename, int num_parameters);

} // namespace ionbench

#endif // READ_BENCHMARK_CONFIGURATION_HPP
