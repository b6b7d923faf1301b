#include "puaa/util/file_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

#include <sys/stat.h>
#include <unistd.h>

#include "puaa/error.hpp"
#include "puaa/logging.hpp"

namespace fs = std::filesystem;

namespace puaa::util {

namespace {

std::ifstream open_for_read(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError("file not found", path.string());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("could not open file for reading", path.string());
    }
    return in;
}

} // namespace

std::string read_text_file(const fs::path& path) {
    std::ifstream in = open_for_read(path);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IOError("read failed", path.string());
    }
    return data;
}

std::vector<uint8_t> read_binary_file(const fs::path& path) {
    std::string data = read_text_file(path);
    return std::vector<uint8_t>(data.begin(), data.end());
}

void write_file_atomic(const fs::path& path, std::span<const uint8_t> data) {
    fs::path dir = path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    // A replaced file keeps its mode; a new one gets the usual 0644
    mode_t mode = 0644;
    struct stat existing;
    if (::stat(path.c_str(), &existing) == 0 && S_ISREG(existing.st_mode)) {
        mode = existing.st_mode & 07777;
    }

    std::string tmpl = (dir / (path.filename().string() + ".tmp-XXXXXX")).string();
    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        throw IOError(std::string("could not create temporary file: ") + std::strerror(errno),
                      path.string(), ErrorCode::WRITE_FAILED);
    }

    auto fail = [&](const std::string& what) {
        int err = errno;
        ::close(fd);
        ::unlink(tmpl.c_str());
        throw IOError(what + ": " + std::strerror(err), path.string(), ErrorCode::WRITE_FAILED);
    };

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("write failed");
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        fail("fsync failed");
    }
    // mkstemp creates 0600
    if (::fchmod(fd, mode) != 0) {
        fail("fchmod failed");
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmpl.c_str());
        throw IOError(std::string("close failed: ") + std::strerror(err), path.string(),
                      ErrorCode::WRITE_FAILED);
    }

    if (std::rename(tmpl.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmpl.c_str());
        throw IOError(std::string("rename failed: ") + std::strerror(err), path.string(),
                      ErrorCode::WRITE_FAILED);
    }

    LOG_DEBUG("Wrote ", data.size(), " bytes to ", path.string());
}

} // namespace puaa::util
