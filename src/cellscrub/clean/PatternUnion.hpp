#pragma once

#include "cellscrub/scan/Finding.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace clean {

/**
 * @brief 所有命中模式解码后的字符并集
 *
 * 按首次出现顺序去重；无法解码的记号被跳过。每次清理只计算一次。
 */
class PatternUnion {
public:
    PatternUnion() = default;

    static PatternUnion fromFindings(const std::vector<scan::Finding>& findings);
    static PatternUnion fromPatterns(const std::vector<std::string>& patterns);

    /**
     * @brief 解码后的字符（UTF-8）
     */
    const std::vector<std::string>& characters() const { return characters_; }
    size_t size() const { return characters_.size(); }
    bool empty() const { return characters_.empty(); }
    bool contains(const std::string& character) const;

    /**
     * @brief 把并集中的每个字符都替换为 replacement（为空即删除）
     *
     * 只扫描一遍原文，replacement 中即使含有并集字符也保持原样。
     */
    std::string apply(const std::string& text, const std::string& replacement) const;

    /**
     * @brief 被跳过的无法解码的模式个数
     */
    size_t undecodableCount() const { return undecodable_; }

private:
    void add(const std::string& pattern);

    std::vector<std::string> characters_;
    size_t undecodable_ = 0;
};

/**
 * @brief 替换 text 中所有 needle（非重叠，从左到右）
 */
std::string replaceAll(const std::string& text, const std::string& needle, const std::string& replacement);

}} // namespace cellscrub::clean
