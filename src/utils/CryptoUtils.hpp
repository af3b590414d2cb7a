#pragma once
#include <cstddef>
#include <string>

class CryptoUtils {
public:
    // Whole-file SHA-1 as lowercase hex; throws std::runtime_error if the file cannot be read
    static std::string sha1_file_hex(const std::string& path);
    static std::string to_hex(const unsigned char* data, size_t length);
};
