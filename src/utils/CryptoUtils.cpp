#include "CryptoUtils.hpp"
#include "../core/Config.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string CryptoUtils::sha1_file_hex(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    SHA_CTX ctx;
    SHA1_Init(&ctx);

    std::vector<char> buffer(Config::DIGEST_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            SHA1_Update(&ctx, buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path);
    }

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1_Final(hash, &ctx);
    return to_hex(hash, SHA_DIGEST_LENGTH);
}

std::string CryptoUtils::to_hex(const unsigned char* data, size_t length) {
    std::ostringstream oss;
    for (size_t i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return oss.str();
}
