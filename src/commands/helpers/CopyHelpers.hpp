#ifndef COPY_HELPERS_HPP
#define COPY_HELPERS_HPP

#include "../../core/CopyResult.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace CopyHelpers {

/**
 * Resolve the real destination path; a directory target receives the
 * source's base name, as cp does
 * @param source_file Path of the source file
 * @param destination Destination given on the command line
 * @return Path of the file to write
 */
std::string resolve_destination(const std::string& source_file, const std::string& destination);

/**
 * Parse a byte count with an optional K, M or G suffix (powers of 1024)
 * @param text e.g. "64M", "4096", "1.5G"
 * @return Size in bytes
 * @throws std::invalid_argument on malformed or non-positive input
 */
int64_t parse_size(const std::string& text);

/**
 * Parse a positive integer command-line value
 * @throws std::invalid_argument when text is not a positive integer
 */
int parse_positive_int(const std::string& text, const std::string& option);

/**
 * Print one line per failed slice plus the overall outcome
 */
void print_run_summary(const CopyRunResult& result, std::ostream& out);

/**
 * Write the run result as JSON
 * @throws std::runtime_error when the report file cannot be written
 */
void write_report(const std::string& report_file, const CopyRunResult& result);

/**
 * Compare whole-file SHA-1 digests of source and destination
 * @return true if both files hash identically
 */
bool verify_copy(const std::string& source_file, const std::string& destination);

} // namespace CopyHelpers

#endif // COPY_HELPERS_HPP
