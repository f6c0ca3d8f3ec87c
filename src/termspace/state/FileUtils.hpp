#pragma once
#include <termspace/core/Error.hpp>

#include <filesystem>
#include <string>

namespace TS::FileUtils {

auto fsyncFileDescriptor(int fd) -> Expected<void>;
auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Writes to "<path>.tmp", optionally fsyncs, then renames over path.
auto writeTextFileAtomic(std::filesystem::path const& path, std::string const& text, bool fsyncData) -> Expected<void>;
auto writeTextFile(std::filesystem::path const& path, std::string const& text) -> Expected<void>;
auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

} // namespace TS::FileUtils
