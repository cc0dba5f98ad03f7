#include "chunkvault/fileio.hpp"

#include "chunkvault/constants.hpp"
#include "chunkvault/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#if !defined(_WIN32)
    #include <fcntl.h>
    #include <unistd.h>
#endif

namespace chunkvault::fileio {

namespace {

std::string TempPathFor(const std::string& path) {
    Bytes suffix = crypto::RandomBytes(6);
    return path + "." + crypto::HexEncode(suffix.data(), suffix.size()) + std::string(constants::kTempSuffix);
}

// fsync on a directory makes a finished rename durable.
void SyncPath(const std::string& path) {
#if !defined(_WIN32)
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw StorageError("Failed to open " + path + " for sync: " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc < 0 && err != EINVAL) {
        throw StorageError("Failed to sync " + path + ": " + std::strerror(err));
    }
#else
    (void)path;
#endif
}

bool WriteAndSync(std::FILE* fp, const std::uint8_t* data, std::size_t size) {
    if (size > 0 && std::fwrite(data, 1, size, fp) != size) {
        return false;
    }
    if (std::fflush(fp) != 0) {
        return false;
    }
#if !defined(_WIN32)
    if (::fsync(::fileno(fp)) < 0 && errno != EINVAL) {
        return false;
    }
#endif
    return true;
}

}  // namespace

Bytes ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw StorageError("Failed to open file: " + path);
    }
    Bytes data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw StorageError("Failed to read file: " + path);
    }
    return data;
}

std::string ReadText(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw StorageError("Failed to open file: " + path);
    }
    std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw StorageError("Failed to read file: " + path);
    }
    return data;
}

void WriteFileAtomic(const std::string& path, const std::uint8_t* data, std::size_t size) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw StorageError("Failed to create directory " + target.parent_path().string() + ": "
                               + ec.message());
        }
    }
    std::string temp = TempPathFor(path);
    std::FILE* fp = std::fopen(temp.c_str(), "wb");
    if (!fp) {
        throw StorageError("Failed to open output file: " + temp);
    }
    bool written = WriteAndSync(fp, data, size);
    if (std::fclose(fp) != 0) {
        written = false;
    }
    if (!written) {
        fs::remove(temp, ec);
        throw StorageError("Failed to write file: " + path);
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw StorageError("Failed to move " + temp + " into place: " + ec.message());
    }
    fs::path parent = target.has_parent_path() ? target.parent_path() : fs::path(".");
    SyncPath(parent.string());
}

}  // namespace chunkvault::fileio
