#pragma once

#include "cellscrub/archive/ZipError.hpp"
#include "cellscrub/core/Path.hpp"
#include <ctime>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cellscrub {
namespace archive {

/**
 * @brief ZIP 读取器（minizip-ng）
 *
 * 打开时按中央目录顺序缓存条目信息，listFiles() 保持该顺序，
 * 复制整个包时条目顺序不变。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * @brief 打开 ZIP 文件
     * @return 是否成功
     */
    bool open();
    void close();
    bool isOpen() const { return is_open_; }

    /**
     * @brief 条目路径列表（中央目录顺序）
     */
    std::vector<std::string> listFiles() const;
    const std::vector<EntryInfo>& listEntriesInfo() const { return entries_; }

    bool hasFile(std::string_view internal_path) const;
    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    /**
     * @brief 解压条目到字符串
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data);

    const core::Path& getPath() const { return filepath_; }

private:
    void cleanup();
    void buildEntryCache();

    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;

    std::vector<EntryInfo> entries_;
    std::unordered_map<std::string, size_t> entry_index_;
};

}} // namespace cellscrub::archive
