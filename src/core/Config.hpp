#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace Config {
    // Slicing and worker configuration
    constexpr int DEFAULT_PARTS = 5;
    constexpr int DEFAULT_WORKERS = 5;

    // I/O chunk per read/write call, independent of slice size
    constexpr size_t CHUNK_SIZE = 1024 * 1024; // 1 MiB

    // How often the caller's progress callback fires
    constexpr int PROGRESS_INTERVAL_MS = 200;

    // Mode for a newly created destination
    constexpr unsigned DEST_FILE_MODE = 0644;

    // Digest read buffer
    constexpr size_t DIGEST_BUFFER_SIZE = 64 * 1024;

    // Progress bar
    constexpr int PROGRESS_BAR_WIDTH = 40;
}

#endif // CONFIG_HPP
