#pragma once

#include "cellscrub/clean/CleaningEngine.hpp"
#include <iosfwd>

namespace cellscrub {
namespace app {

/**
 * @brief 控制台决策器：打印 Finding 与 8 个选项，读取选择和替换文本
 *
 * 无效输入按"跳过本单元格"处理；输入流结束时视为"跳过剩余全部"。
 */
class InteractiveDecider {
public:
    InteractiveDecider(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    clean::Decision operator()(const scan::Finding& finding, const clean::CleaningContext& context);

    /**
     * @brief 解析选项编号 "1".."8"
     * @return 是否为有效选项
     */
    static bool parseChoice(const std::string& input, clean::Action& action);

    static bool needsReplacement(clean::Action action);

private:
    void printFinding(const scan::Finding& finding, const clean::CleaningContext& context);

    std::istream& in_;
    std::ostream& out_;
};

}} // namespace cellscrub::app
