#include "CopyHelpers.hpp"
#include "../../utils/CryptoUtils.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace CopyHelpers {

std::string resolve_destination(const std::string& source_file, const std::string& destination) {
    std::error_code ec;
    if (std::filesystem::is_directory(destination, ec)) {
        std::filesystem::path file_name = std::filesystem::path(source_file).filename();
        return (std::filesystem::path(destination) / file_name).string();
    }
    return destination;
}

int64_t parse_size(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty size");
    }

    char* endp = nullptr;
    errno = 0;
    double val = std::strtod(text.c_str(), &endp);
    if (endp == text.c_str() || errno == ERANGE || !std::isfinite(val) || val <= 0) {
        throw std::invalid_argument("Invalid size: " + text);
    }

    std::string suffix(endp);
    if (suffix.size() > 1) {
        throw std::invalid_argument("Invalid size suffix: " + text);
    }
    switch (suffix.empty() ? '\0' : std::toupper(static_cast<unsigned char>(suffix[0]))) {
        case 'G':
            val *= 1024.0 * 1024.0 * 1024.0;
            break;
        case 'M':
            val *= 1024.0 * 1024.0;
            break;
        case 'K':
            val *= 1024.0;
            break;
        case '\0':
            break;
        default:
            throw std::invalid_argument("Invalid size suffix: " + text);
    }

    if (val >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw std::invalid_argument("Size too large: " + text);
    }
    int64_t bytes = static_cast<int64_t>(val);
    if (bytes < 1) {
        throw std::invalid_argument("Size rounds to zero bytes: " + text);
    }
    return bytes;
}

int parse_positive_int(const std::string& text, const std::string& option) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a positive integer, got '" + text + "'");
    }
    if (consumed != text.size() || value < 1) {
        throw std::invalid_argument(option + " expects a positive integer, got '" + text + "'");
    }
    return value;
}

void print_run_summary(const CopyRunResult& result, std::ostream& out) {
    for (const auto& slice : result.failed_slices()) {
        out << "  slice " << slice.index << ": " << error_kind_name(slice.error)
            << " at offset " << slice.offset_reached << " after " << slice.bytes_copied
            << " bytes";
        if (!slice.reason.empty()) {
            out << " - " << slice.reason;
        }
        out << std::endl;
    }
    out << "Copied " << result.total_bytes_copied << " of " << result.file_size << " bytes in "
        << result.slices.size() << " slices: " << (result.ok() ? "success" : "FAILED") << std::endl;
}

void write_report(const std::string& report_file, const CopyRunResult& result) {
    std::ofstream file(report_file);
    if (!file) {
        throw std::runtime_error("Failed to create report file: " + report_file);
    }
    file << result.to_json().dump(2) << std::endl;
    if (!file) {
        throw std::runtime_error("Failed to write report file: " + report_file);
    }
}

bool verify_copy(const std::string& source_file, const std::string& destination) {
    std::string source_hash = CryptoUtils::sha1_file_hex(source_file);
    std::string dest_hash = CryptoUtils::sha1_file_hex(destination);
    if (source_hash != dest_hash) {
        std::cerr << "Digest mismatch: " << source_hash << " (source) vs " << dest_hash
                  << " (destination)" << std::endl;
        return false;
    }
    std::cout << "Verified SHA-1 " << source_hash << std::endl;
    return true;
}

} // namespace CopyHelpers
