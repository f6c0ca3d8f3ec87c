#include "state/FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace TS::FileUtils {

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0)
        return std::unexpected(Error{Error::Code::IOError, "fsync failed"});
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return std::unexpected(Error{Error::Code::IOError, "open directory failed"});
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

auto writeTextFileAtomic(std::filesystem::path const& path, std::string const& text, bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec)
            return std::unexpected(Error{Error::Code::IOError, "Failed to create directories"});
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0)
        return std::unexpected(Error{Error::Code::IOError, "Failed to open temp file"});

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto written = ::write(fd, text.data() + totalWritten, text.size() - totalWritten);
        if (written <= 0) {
            ::close(fd);
            std::filesystem::remove(tmpPath, ec);
            return std::unexpected(Error{Error::Code::IOError, "Failed to write temp file"});
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            ::close(fd);
            std::filesystem::remove(tmpPath, ec);
            return sync;
        }
    }

    if (::close(fd) != 0) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(Error{Error::Code::IOError, "Failed to close temp file"});
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tmpPath, removeEc);
        return std::unexpected(Error{Error::Code::IOError, "Failed to rename temp file"});
    }

    if (fsyncData && !parent.empty()) {
        if (auto syncDir = fsyncDirectory(parent); !syncDir)
            return syncDir;
    }
    return {};
}

auto writeTextFile(std::filesystem::path const& path, std::string const& text) -> Expected<void> {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream)
        return std::unexpected(Error{Error::Code::IOError, "Failed to open file"});
    stream << text;
    if (!stream)
        return std::unexpected(Error{Error::Code::IOError, "Failed to write file"});
    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream)
        return std::unexpected(Error{Error::Code::NotFound, "File not found"});
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof())
        return std::unexpected(Error{Error::Code::IOError, "Failed to read file"});
    return oss.str();
}

} // namespace TS::FileUtils
