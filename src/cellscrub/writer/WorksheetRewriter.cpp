#include "cellscrub/writer/WorksheetRewriter.hpp"
#include "cellscrub/xml/XMLStreamReader.hpp"
#include "cellscrub/xml/XMLStreamWriter.hpp"
#include "cellscrub/utils/ColumnReferenceUtils.hpp"
#include "cellscrub/utils/ModuleLoggers.hpp"
#include <charconv>
#include <fmt/format.h>
#include <set>

namespace cellscrub {
namespace writer {

namespace {

int parseRowNumber(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return (ec == std::errc() && ptr == text.data() + text.size()) ? value : 0;
}

} // namespace

core::Result<WorksheetRewriter::RewriteResult> WorksheetRewriter::rewrite(std::string_view sheet_xml,
                                                                          const Replacements& replacements) {
    xml::XMLStreamWriter out;
    out.startDocument("UTF-8", true);

    RewriteResult result;
    std::set<std::string> pending;
    for (const auto& [ref, text] : replacements) {
        pending.insert(ref);
    }

    int current_row = 0;
    uint32_t next_col = 1;
    int suppress_depth = -1;            // 被替换单元格的深度，其子元素不写出
    const std::string* replacement = nullptr;

    xml::XMLStreamReader reader;
    reader.setStartElementCallback([&](std::string_view name, xml::span<const xml::XMLAttribute> attributes, int depth) {
        if (suppress_depth >= 0) {
            return;
        }

        if (name == "row") {
            current_row = current_row + 1;
            for (const auto& attr : attributes) {
                if (attr.name == "r") current_row = parseRowNumber(attr.value);
            }
            next_col = 1;
        }

        std::string ref;
        if (name == "c") {
            uint32_t col = 0;
            uint32_t row = 0;
            for (const auto& attr : attributes) {
                if (attr.name == "r" && utils::ColumnReferenceUtils::splitCellRef(attr.value, col, row)) {
                    ref = std::string(attr.value);
                }
            }
            if (ref.empty()) {
                col = next_col;
                ref = utils::ColumnReferenceUtils::makeCellRef(col, static_cast<uint32_t>(current_row > 0 ? current_row : 1));
            }
            next_col = col + 1;
        }

        auto it = ref.empty() ? replacements.end() : replacements.find(ref);
        out.startElement(name);
        if (it == replacements.end()) {
            for (const auto& attr : attributes) {
                out.writeAttribute(attr.name, attr.value);
            }
            return;
        }

        for (const auto& attr : attributes) {
            if (attr.name != "t") {
                out.writeAttribute(attr.name, attr.value);
            }
        }
        out.writeAttribute("t", "inlineStr");
        suppress_depth = depth;
        replacement = &it->second;
        pending.erase(ref);
    });

    reader.setEndElementCallback([&](std::string_view /*name*/, int depth) {
        if (suppress_depth >= 0) {
            if (depth != suppress_depth) {
                return;
            }
            out.startElement("is");
            out.startElement("t");
            out.writeAttribute("xml:space", "preserve");
            out.writeText(*replacement);
            out.endElement();
            out.endElement();
            suppress_depth = -1;
            replacement = nullptr;
            result.cells_replaced++;
        }
        out.endElement();
    });

    reader.setTextCallback([&](std::string_view text, int /*depth*/) {
        if (suppress_depth < 0 && out.getDepth() > 0) {
            out.writeText(text);
        }
    });

    reader.setCommentCallback([&](std::string_view comment, int /*depth*/) {
        if (suppress_depth < 0) out.writeComment(comment);
    });

    reader.setProcessingInstructionCallback([&](std::string_view target, std::string_view data, int /*depth*/) {
        if (suppress_depth < 0) out.writeProcessingInstruction(target, data);
    });

    auto status = reader.parseFromString(sheet_xml);
    if (status != xml::XMLParseError::Ok) {
        return core::makeError(core::ErrorCode::XmlParseError, reader.getLastErrorMessage(), "worksheet rewrite");
    }

    for (const auto& ref : pending) {
        WRITER_WARN("Cell {} not present in worksheet XML, change not written", ref);
    }
    if (!pending.empty()) {
        return core::makeError(core::ErrorCode::MissingCell,
                               fmt::format("{} changed cell(s) not found in worksheet XML", pending.size()),
                               *pending.begin());
    }

    result.xml = out.release();
    return result;
}

}} // namespace cellscrub::writer
