/**
 * @file batch_processor.hpp
 * @brief Batch conversion of a directory of containers
 *
 * @details The BatchProcessor class runs the FileConverter over a list of
 *          input files:
 *
 *          - Files are converted one after another, in sorted order
 *
 *          - Parallelism lives inside a file (the converter's worker pool)
 *
 *          - A failure in one file never stops the batch
 *
 *          - A summary table is printed when the batch ends
 */

#ifndef HLS_PACK_BATCH_PROCESSOR_HPP
#define HLS_PACK_BATCH_PROCESSOR_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "converter.hpp"
#include "logging.hpp"
#include "progress.hpp"

namespace hls_pack {

/**
 * @brief Regular files in dir whose extension matches ext.
 * @note Extension comparison is case-insensitive. Result is sorted.
 */
std::vector<std::filesystem::path> find_inputs(const std::filesystem::path &dir,
                                               const std::string &ext,
                                               Logger &log);

/**
 * @struct BatchTotals
 * @brief Counters for the batch summary.
 */
struct BatchTotals {
  int files = 0;
  int converted = 0;
  int failed = 0;
  size_t renditions_produced = 0;
  size_t renditions_dropped = 0;
};

/**
 * @class BatchProcessor
 * @brief Converts every input file with one FileConverter.
 */
class BatchProcessor {
public:
  BatchProcessor(ConverterOptions options, ProgressRegistry &registry,
                 Logger &log);

  /**
   * @brief Convert all files.
   * @param input_files Containers to convert, in processing order
   * @return Number of files that failed (0 = all succeeded)
   */
  int process(const std::vector<std::filesystem::path> &input_files);

  const std::vector<FileReport> &reports() const { return reports_; }

  BatchTotals totals() const;

private:
  FileConverter converter_;
  Logger &log_;
  int parallel_jobs_;
  std::vector<FileReport> reports_;
  std::vector<std::string> errors_; //< Files aborted by an exception

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec) const;
};

} // namespace hls_pack

#endif // HLS_PACK_BATCH_PROCESSOR_HPP
