#include "ProgressBar.hpp"
#include "../../core/Config.hpp"
#include <iomanip>
#include <sstream>

ProgressBar::ProgressBar(int64_t total, std::ostream& out)
    : total_bytes(total), out(out), start_time(std::chrono::steady_clock::now()) {}

void ProgressBar::update(int64_t copied) {
    if (finished) return;
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    out << '\r' << render(copied, elapsed) << std::flush;
}

void ProgressBar::finish(int64_t copied) {
    if (finished) return;
    update(copied);
    out << std::endl;
    finished = true;
}

std::string ProgressBar::render(int64_t copied, double elapsed_seconds) const {
    double done = static_cast<double>(copied);
    double total = static_cast<double>(total_bytes);
    double pct = total > 0 ? done / total * 100.0 : 100.0;
    double rate = elapsed_seconds > 0.01 ? done / elapsed_seconds : 0.0;

    const int width = Config::PROGRESS_BAR_WIDTH;
    int filled = total > 0 ? static_cast<int>(pct / 100.0 * width) : width;
    if (filled > width) filled = width;

    std::string bar(static_cast<size_t>(filled), '=');
    if (filled < width) {
        bar += '>';
        bar.append(static_cast<size_t>(width - filled - 1), ' ');
    }

    std::ostringstream oss;
    oss << copied << "/" << total_bytes << "  (" << std::fixed << std::setprecision(0) << std::setw(3)
        << pct << "%)  [" << bar << "]  " << format_bytes(rate) << "/s";

    if (rate > 0 && total > done) {
        int remaining = static_cast<int>((total - done) / rate);
        oss << "  ETA " << remaining / 60 << ":" << std::setw(2) << std::setfill('0') << remaining % 60;
    }
    return oss.str();
}

std::string ProgressBar::format_bytes(double bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (bytes >= 1024.0 * 1024.0 * 1024.0) {
        oss << bytes / (1024.0 * 1024.0 * 1024.0) << " GiB";
    } else if (bytes >= 1024.0 * 1024.0) {
        oss << bytes / (1024.0 * 1024.0) << " MiB";
    } else if (bytes >= 1024.0) {
        oss << bytes / 1024.0 << " KiB";
    } else {
        oss << std::setprecision(0) << bytes << " B";
    }
    return oss.str();
}
