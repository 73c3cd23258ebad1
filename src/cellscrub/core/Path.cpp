#include "cellscrub/core/Path.hpp"
#include "cellscrub/core/Constants.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <memory>

namespace cellscrub {
namespace core {

namespace {

struct FileCloser {
    void operator()(FILE* file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

} // namespace

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

std::string Path::filename() const {
    return std::filesystem::u8path(utf8_path_).filename().u8string();
}

std::string Path::stem() const {
    return std::filesystem::u8path(utf8_path_).stem().u8string();
}

std::string Path::extension() const {
    return std::filesystem::u8path(utf8_path_).extension().u8string();
}

Path Path::parent() const {
    return Path(std::filesystem::u8path(utf8_path_).parent_path().u8string());
}

Path Path::operator/(const std::string& child) const {
    if (utf8_path_.empty()) {
        return Path(child);
    }
    return Path((std::filesystem::u8path(utf8_path_) / std::filesystem::u8path(child)).u8string());
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::u8path(utf8_path_), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::u8path(utf8_path_), ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;
    std::error_code ec;
    auto size = std::filesystem::file_size(std::filesystem::u8path(utf8_path_), ec);
    if (ec) {
        CORE_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    bool removed = std::filesystem::remove(std::filesystem::u8path(utf8_path_), ec);
    if (ec) {
        CORE_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "rb" : "r");
}

FILE* Path::openForWrite(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "wb" : "w");
}

Result<std::string> Path::readAll() const {
    if (!isFile()) {
        return makeError(ErrorCode::FileNotFound, "File not found", utf8_path_);
    }

    FilePtr file(openForRead(true));
    if (!file) {
        return makeError(ErrorCode::FileAccessDenied, "Cannot open file for reading", utf8_path_);
    }

    std::string content;
    char buffer[Constants::kIOBufferSize];
    size_t read = 0;
    while ((read = std::fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
        content.append(buffer, read);
    }
    if (std::ferror(file.get())) {
        return makeError(ErrorCode::FileReadError, "Error while reading file", utf8_path_);
    }
    return content;
}

VoidResult Path::writeAll(const std::string& bytes) const {
    FilePtr file(openForWrite(true));
    if (!file) {
        return makeError(ErrorCode::FileWriteError, "Cannot open file for writing", utf8_path_);
    }

    size_t written = bytes.empty() ? 0 : std::fwrite(bytes.data(), 1, bytes.size(), file.get());
    bool failed = written != bytes.size() || std::fflush(file.get()) != 0;
    file.reset();

    if (failed) {
        remove();
        return makeError(ErrorCode::FileWriteError, "Short write", utf8_path_);
    }
    return VoidResult();
}

}} // namespace cellscrub::core
