#pragma once

#include "cellscrub/archive/ZipError.hpp"
#include "cellscrub/core/Path.hpp"
#include <ctime>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cellscrub {
namespace archive {

/**
 * @brief ZIP 写入器（minizip-ng）
 *
 * 特性：
 * - 防重复写入（同一路径只写一次）
 * - 关闭时严格检查中央目录写出结果
 * - 可指定条目修改时间，复制包时保留原时间
 */
class ZipWriter {
public:
    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };

    explicit ZipWriter(const core::Path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * 创建 ZIP 文件进行写入，已存在的同名文件会被删除
     * @return 是否成功
     */
    bool open();

    /**
     * 关闭 ZIP 文件
     * @return 中央目录是否成功写出
     */
    bool close();

    bool isOpen() const { return is_open_; }

    /**
     * 添加文件（字符串内容）
     * @param internal_path ZIP内部路径
     * @param content 文件内容
     * @param modified_date 修改时间，0 表示当前时间
     * @return 错误码
     */
    ZipError addFile(std::string_view internal_path, std::string_view content, time_t modified_date = 0);

    /**
     * 添加文件（二进制数据）
     */
    ZipError addFile(std::string_view internal_path, const void* data, size_t size, time_t modified_date = 0);

    /**
     * 设置压缩级别
     * @param level 压缩级别（0-9，0=无压缩）
     */
    ZipError setCompressionLevel(int level);
    int getCompressionLevel() const { return compression_level_; }

    bool hasEntry(const std::string& internal_path) const {
        return written_paths_.count(internal_path) > 0;
    }

    const Stats& getStats() const { return stats_; }
    const core::Path& getPath() const { return filepath_; }

private:
    bool initializeWriter();
    void cleanup();
    void initializeFileInfo(void* file_info, const std::string& path, size_t size, time_t modified_date);
    ZipError writeFileEntry(const std::string& internal_path, const void* data, size_t size, time_t modified_date);

    void* zip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    int compression_level_ = 6;

    std::unordered_set<std::string> written_paths_;
    Stats stats_;
    mutable std::mutex mutex_;
};

}} // namespace cellscrub::archive
