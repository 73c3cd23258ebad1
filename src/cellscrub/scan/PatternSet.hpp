#pragma once

#include "cellscrub/scan/Pattern.hpp"
#include "cellscrub/core/Expected.hpp"
#include <string>
#include <vector>

namespace cellscrub {
namespace scan {

/**
 * @brief 有序的目标模式集合
 */
class PatternSet {
public:
    using const_iterator = std::vector<Pattern>::const_iterator;

    PatternSet() = default;
    explicit PatternSet(std::vector<Pattern> patterns) : patterns_(std::move(patterns)) {}

    /**
     * @brief 默认集合：字面字符 U+0080..U+00FF，随后是记号 "\x80".."\xff"，共 256 个
     */
    static PatternSet defaultPatterns();

    /**
     * @brief 用户指定的单个模式
     *
     * 含反斜杠时先解码，解码得到的字符成为模式本身；
     * 因此真实数据中的字面反斜杠无法作为目标。
     * 解码失败或结果不是单个字符时返回 DecodeError，空串返回 InvalidArgument。
     */
    static core::Result<PatternSet> single(const std::string& user_pattern);

    /**
     * @brief 解析模式对应的码点
     *
     * 不含反斜杠且恰为一个码点时直接返回；否则按转义序列解码，
     * 结果必须恰为一个码点，不然返回 DecodeError。
     */
    static core::Result<char32_t> resolve(const Pattern& pattern);

    /**
     * @brief 解析后的 UTF-8 文本，清理时用它做查找与替换
     */
    static core::Result<std::string> decodedText(const Pattern& pattern);

    void add(const Pattern& pattern) { patterns_.push_back(pattern); }

    size_t size() const { return patterns_.size(); }
    bool empty() const { return patterns_.empty(); }
    const Pattern& operator[](size_t index) const { return patterns_[index]; }

    const_iterator begin() const { return patterns_.begin(); }
    const_iterator end() const { return patterns_.end(); }

    const std::vector<Pattern>& patterns() const { return patterns_; }

private:
    std::vector<Pattern> patterns_;
};

}} // namespace cellscrub::scan
