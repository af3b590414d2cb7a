#include "CommandHandler.hpp"
#include "helpers/CopyHelpers.hpp"
#include "helpers/ProgressBar.hpp"
#include "../core/Config.hpp"
#include "../core/CopyError.hpp"
#include "../core/CopyOrchestrator.hpp"
#include "../core/SliceCalculator.hpp"
#include "../io/FileHandle.hpp"
#include "../utils/CryptoUtils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

// ============================================================================
// COMMAND EXECUTOR
// ============================================================================

int CommandHandler::execute(const std::string& command, const std::vector<std::string>& args) {
    if (command == "copy") {
        return handle_copy(args);
    } else if (command == "plan") {
        return handle_plan(args);
    } else if (command == "digest") {
        return handle_digest(args);
    }
    std::cerr << "Unknown command: " << command << std::endl;
    return 1;
}

// ============================================================================
// COPY
// ============================================================================

int CommandHandler::handle_copy(const std::vector<std::string>& args) {
    const char* usage =
        "Usage: copy [-p <parts>] [-s <slice_size>] [-j <jobs>] [-c <chunk_size>] [--keep-going]\n"
        "            [--no-progress] [--verify] [--report <file>] [--remove-partial] <source> <destination>";

    CopyOptions options;
    bool show_progress = true;
    bool verify = false;
    bool remove_partial = false;
    std::string report_file;
    std::vector<std::string> positional;

    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            auto value = [&]() -> const std::string& {
                if (i + 1 >= args.size()) {
                    throw std::invalid_argument(arg + " requires a value");
                }
                return args[++i];
            };

            if (arg == "-p" || arg == "--parts") {
                options.slice_count = CopyHelpers::parse_positive_int(value(), arg);
            } else if (arg == "-s" || arg == "--slice-size") {
                options.slice_size = CopyHelpers::parse_size(value());
            } else if (arg == "-j" || arg == "--jobs") {
                options.concurrency = CopyHelpers::parse_positive_int(value(), arg);
            } else if (arg == "-c" || arg == "--chunk-size") {
                options.chunk_size = static_cast<size_t>(CopyHelpers::parse_size(value()));
            } else if (arg == "--keep-going") {
                options.cancel_pending_on_failure = false;
            } else if (arg == "--no-progress") {
                show_progress = false;
            } else if (arg == "--verify") {
                verify = true;
            } else if (arg == "--report") {
                report_file = value();
            } else if (arg == "--remove-partial") {
                remove_partial = true;
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw std::invalid_argument("Unknown option: " + arg);
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << usage << std::endl;
        return 1;
    }

    if (positional.size() != 2) {
        std::cerr << usage << std::endl;
        return 1;
    }

    std::string source_file = positional[0];
    std::string destination = CopyHelpers::resolve_destination(source_file, positional[1]);

    try {
        std::error_code ec;
        auto source_size = std::filesystem::file_size(source_file, ec);
        if (!ec) {
            auto slices = CopyOrchestrator::plan_slices(static_cast<int64_t>(source_size), options);
            int workers = std::min(options.concurrency, static_cast<int>(slices.size()));
            std::cout << "Copying " << source_size << " bytes using " << slices.size()
                      << " slices and " << workers << " workers" << std::endl;
        }

        std::unique_ptr<ProgressBar> bar;
        ProgressCallback on_progress;
        if (show_progress) {
            on_progress = [&bar](int64_t copied, int64_t total) {
                if (!bar) {
                    bar = std::make_unique<ProgressBar>(total);
                }
                bar->update(copied);
            };
        }

        auto start_time = std::chrono::steady_clock::now();
        CopyRunResult result = CopyOrchestrator::run(source_file, destination, options, on_progress);
        auto end_time = std::chrono::steady_clock::now();

        if (bar) {
            bar->finish(result.total_bytes_copied);
        }

        if (!report_file.empty()) {
            CopyHelpers::write_report(report_file, result);
        }

        if (!result.ok()) {
            CopyHelpers::print_run_summary(result, std::cerr);
            if (remove_partial) {
                std::filesystem::remove(destination, ec);
                if (ec) {
                    std::cerr << "Could not remove " << destination << ": " << ec.message() << std::endl;
                } else {
                    std::cerr << "Removed partial destination " << destination << std::endl;
                }
            } else {
                std::cerr << "Destination " << destination << " is incomplete" << std::endl;
            }
            return 1;
        }

        auto duration = std::chrono::duration<double>(end_time - start_time).count();
        double speed_mbps = (result.file_size / (1024.0 * 1024.0)) / std::max(duration, 0.001);
        std::cout << "Copied " << result.total_bytes_copied << " bytes in " << std::fixed
                  << std::setprecision(2) << duration << " seconds (" << speed_mbps << " MB/s)"
                  << std::endl;

        if (verify && !CopyHelpers::verify_copy(source_file, destination)) {
            return 1;
        }

        std::cout << "All done!" << std::endl;
        return 0;

    } catch (const CopyError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Copy failed: " << e.what() << std::endl;
    }
    return 1;
}

// ============================================================================
// INSPECTION COMMANDS
// ============================================================================

int CommandHandler::handle_plan(const std::vector<std::string>& args) {
    const char* usage = "Usage: plan [-p <parts> | -s <slice_size>] <file>";

    CopyOptions options;
    std::string file;

    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if ((arg == "-p" || arg == "--parts") && i + 1 < args.size()) {
                options.slice_count = CopyHelpers::parse_positive_int(args[++i], arg);
            } else if ((arg == "-s" || arg == "--slice-size") && i + 1 < args.size()) {
                options.slice_size = CopyHelpers::parse_size(args[++i]);
            } else if (file.empty() && !arg.empty() && arg[0] != '-') {
                file = arg;
            } else {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << usage << std::endl;
        return 1;
    }

    if (file.empty()) {
        std::cerr << usage << std::endl;
        return 1;
    }

    try {
        auto handle = FileHandle::open_source(file);
        int64_t size = handle->size();
        if (size < 0) {
            throw CopyError(ErrorKind::SourceUnreadable, "cannot determine size of " + file);
        }
        auto slices = CopyOrchestrator::plan_slices(size, options);
        std::cout << plan_to_json(size, slices).dump(2) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}

int CommandHandler::handle_digest(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: digest <file>" << std::endl;
        return 1;
    }

    try {
        std::cout << CryptoUtils::sha1_file_hex(args[0]) << "  " << args[0] << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
