#pragma once

#include <string>
#include <cstdint>

namespace cellscrub {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Number = 1,
    String = 2,
    Boolean = 3,
    Formula = 4,
    Error = 5
};

/**
 * @brief 单元格值
 *
 * 只有 String 类型的文本参与扫描和改写；其余类型按原样保存，
 * 供表头显示与回读校验使用。
 */
class Cell {
private:
    CellType type_ = CellType::Empty;
    double number_ = 0.0;
    bool boolean_ = false;
    std::string text_;      // 字符串值 / 错误值 / 公式缓存结果
    std::string formula_;

public:
    Cell() = default;

    explicit Cell(const std::string& value);
    explicit Cell(const char* value);
    explicit Cell(double value);
    explicit Cell(int value);
    explicit Cell(bool value);

    /**
     * @brief 公式单元格，cached 为文件中缓存的结果文本
     */
    static Cell makeFormula(const std::string& formula, const std::string& cached = "");

    /**
     * @brief 错误值单元格，如 "#DIV/0!"
     */
    static Cell makeError(const std::string& error_text);

    Cell& operator=(const std::string& value);
    Cell& operator=(double value);
    Cell& operator=(bool value);

    CellType getType() const { return type_; }

    bool isEmpty() const { return type_ == CellType::Empty; }
    bool isNumber() const { return type_ == CellType::Number; }
    bool isString() const { return type_ == CellType::String; }
    bool isBoolean() const { return type_ == CellType::Boolean; }
    bool isFormula() const { return type_ == CellType::Formula; }
    bool isError() const { return type_ == CellType::Error; }

    /**
     * @brief 字符串值；非 String 类型返回空串
     */
    const std::string& getStringValue() const;

    /**
     * @brief 替换文本。非 String 单元格不允许改写，抛 OperationException
     */
    void setStringValue(const std::string& value);

    double getNumberValue() const { return number_; }
    bool getBooleanValue() const { return boolean_; }
    const std::string& getFormula() const { return formula_; }

    /**
     * @brief 显示文本：数字按最短形式（42.0 -> "42"），布尔为 TRUE/FALSE，
     *        公式取缓存结果，空单元格为空串
     */
    std::string asString() const;

    void clear();

    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

}} // namespace cellscrub::core
