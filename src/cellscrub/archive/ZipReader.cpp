#include "cellscrub/archive/ZipReader.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

namespace cellscrub {
namespace archive {

ZipReader::ZipReader(const core::Path& path) : filepath_(path) {}

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open() {
    cleanup();

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries)", filepath_.string(), entries_.size());
    return true;
}

void ZipReader::close() {
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        files.push_back(entry.path);
    }
    return files;
}

bool ZipReader::hasFile(std::string_view internal_path) const {
    return entry_index_.find(std::string(internal_path)) != entry_index_.end();
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    auto it = entry_index_.find(std::string(internal_path));
    if (it == entry_index_.end()) {
        return false;
    }
    info = entries_[it->second];
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }
    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    EntryInfo info;
    if (!getEntryInfo(internal_path, info)) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }
    if (info.uncompressed_size > static_cast<uint64_t>(INT32_MAX)) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", internal_path, info.uncompressed_size);
        return ZipError::TooLarge;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    std::vector<uint8_t> buf(static_cast<size_t>(info.uncompressed_size));
    int32_t total = 0;
    const int32_t expected = static_cast<int32_t>(info.uncompressed_size);
    while (total < expected) {
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, buf.data() + total, expected - total);
        if (read <= 0) break;
        total += read;
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total != expected) {
        ARCHIVE_ERROR("Incomplete read for file {}, expected: {} bytes, read: {} bytes",
                      internal_path, expected, total);
        return ZipError::IoFail;
    }

    data.swap(buf);
    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, data.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

void ZipReader::buildEntryCache() {
    entries_.clear();
    entry_index_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) != MZ_OK || !file_info) {
            continue;
        }
        if (!file_info->filename || file_info->filename[0] == '\0') {
            continue;
        }

        EntryInfo info;
        info.path = file_info->filename;
        info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
        info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
        info.crc32 = file_info->crc;
        info.compression_method = file_info->compression_method;
        info.modified_date = file_info->modified_date;
        info.is_directory = info.path.back() == '/';

        // 重复条目以最后一个为准
        auto existing = entry_index_.find(info.path);
        if (existing != entry_index_.end()) {
            ARCHIVE_WARN("Duplicate zip entry {}", info.path);
            entries_[existing->second] = info;
        } else {
            entry_index_.emplace(info.path, entries_.size());
            entries_.push_back(info);
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entries_.size());
}

}} // namespace cellscrub::archive
