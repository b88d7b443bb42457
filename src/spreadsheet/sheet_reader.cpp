#include "sheet_reader.h"
#include "zip_archive.h"
#include "../common/error_handler.h"
#include "../common/file_utils.h"
#include "../common/os_utils.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>
#include <memory>
#include <sstream>

namespace exportflow {
namespace spreadsheet {

namespace {

// XFD, the last worksheet column, has three letters
constexpr size_t kMaxColumnLetters = 3;

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

XmlDocPtr parseXml(const std::string& content, const std::string& part) {
    xmlDoc* doc = xmlReadMemory(content.data(), static_cast<int>(content.size()), part.c_str(), nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_HUGE);
    if (!doc) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Workbook part is not valid XML", part);
    }
    return XmlDocPtr(doc);
}

bool isElement(const xmlNode* node, const char* localName) {
    return node && node->type == XML_ELEMENT_NODE &&
           xmlStrEqual(node->name, reinterpret_cast<const xmlChar*>(localName));
}

std::string attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) {
        return "";
    }
    std::string text(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return text;
}

// Relationship ids carry the officeDocument namespace prefix
std::string relationshipId(const xmlNode* node) {
    for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
        if (xmlStrEqual(attr->name, reinterpret_cast<const xmlChar*>("id")) && attr->ns) {
            xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
            if (value) {
                std::string text(reinterpret_cast<const char*>(value));
                xmlFree(value);
                return text;
            }
        }
    }
    return "";
}

std::string content(const xmlNode* node) {
    xmlChar* value = xmlNodeGetContent(node);
    if (!value) {
        return "";
    }
    std::string text(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return text;
}

const xmlNode* firstChild(const xmlNode* parent, const char* localName) {
    for (const xmlNode* child = parent ? parent->children : nullptr; child; child = child->next) {
        if (isElement(child, localName)) {
            return child;
        }
    }
    return nullptr;
}

// Text of a shared or inline string: every <t> run, phonetic runs excluded
void collectText(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (isElement(child, "t")) {
            out += content(child);
        } else if (child->type == XML_ELEMENT_NODE && !isElement(child, "rPh")) {
            collectText(child, out);
        }
    }
}

std::vector<std::string> readSharedStrings(const ZipArchive& archive) {
    std::vector<std::string> strings;
    const std::string part = "xl/sharedStrings.xml";
    if (!archive.contains(part)) {
        return strings;
    }

    XmlDocPtr doc = parseXml(archive.extract(part), part);
    for (const xmlNode* si = xmlDocGetRootElement(doc.get())->children; si; si = si->next) {
        if (isElement(si, "si")) {
            std::string text;
            collectText(si, text);
            strings.push_back(text);
        }
    }
    return strings;
}

std::string resolveTarget(const std::string& target) {
    if (utils::StringUtils::startsWith(target, "/")) {
        return target.substr(1);
    }
    if (utils::StringUtils::startsWith(target, "xl/")) {
        return target;
    }
    return "xl/" + target;
}

// Part name of the first sheet listed in the workbook
std::string firstWorksheetPart(const ZipArchive& archive) {
    const std::string workbookPart = "xl/workbook.xml";
    const std::string relsPart = "xl/_rels/workbook.xml.rels";

    if (archive.contains(workbookPart) && archive.contains(relsPart)) {
        XmlDocPtr workbook = parseXml(archive.extract(workbookPart), workbookPart);
        const xmlNode* sheets = firstChild(xmlDocGetRootElement(workbook.get()), "sheets");
        const xmlNode* sheet = firstChild(sheets, "sheet");
        std::string id = sheet ? relationshipId(sheet) : "";

        if (!id.empty()) {
            XmlDocPtr rels = parseXml(archive.extract(relsPart), relsPart);
            for (const xmlNode* rel = xmlDocGetRootElement(rels.get())->children; rel; rel = rel->next) {
                if (isElement(rel, "Relationship") && attribute(rel, "Id") == id) {
                    std::string part = resolveTarget(attribute(rel, "Target"));
                    if (archive.contains(part)) {
                        return part;
                    }
                }
            }
        }
    }

    // Fall back to the lowest-numbered worksheet part
    std::vector<std::string> worksheets;
    for (const auto& name : archive.entryNames()) {
        if (utils::StringUtils::startsWith(name, "xl/worksheets/sheet") && os::PathUtils::getExtension(name) == ".xml") {
            worksheets.push_back(name);
        }
    }
    if (worksheets.empty()) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Workbook has no worksheet", "xl/worksheets/");
    }
    std::sort(worksheets.begin(), worksheets.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() < b.size() : a < b;
    });
    return worksheets.front();
}

// Integral numbers render without a fractional part, as the application shows them
std::string numericText(const std::string& raw) {
    const char* begin = raw.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        return raw;
    }
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        std::ostringstream out;
        out.precision(0);
        out << std::fixed << value;
        return out.str();
    }
    return raw;
}

std::string cellText(const xmlNode* cell, const std::vector<std::string>& sharedStrings) {
    std::string type = attribute(cell, "t");

    if (type == "inlineStr") {
        std::string text;
        if (const xmlNode* is = firstChild(cell, "is")) {
            collectText(is, text);
        }
        return text;
    }

    const xmlNode* valueNode = firstChild(cell, "v");
    if (!valueNode) {
        return "";
    }
    std::string raw = content(valueNode);

    if (type == "s") {
        char* end = nullptr;
        long index = std::strtol(raw.c_str(), &end, 10);
        if (end == raw.c_str() || index < 0 || static_cast<size_t>(index) >= sharedStrings.size()) {
            throw AutomationError(ErrorType::EXPORT_CONTENT, "Shared string index out of range",
                                  attribute(cell, "r") + "=" + raw);
        }
        return sharedStrings[static_cast<size_t>(index)];
    }
    if (type.empty() || type == "n") {
        return numericText(raw);
    }
    return raw;
}

} // anonymous namespace

int Table::columnIndex(const std::string& name) const {
    auto it = std::find(headers.begin(), headers.end(), name);
    return it == headers.end() ? -1 : static_cast<int>(it - headers.begin());
}

int SheetReader::columnFromReference(const std::string& reference) {
    int column = 0;
    size_t letters = 0;
    for (char c : reference) {
        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (upper < 'A' || upper > 'Z') {
            break;
        }
        if (++letters > kMaxColumnLetters) {
            return -1;
        }
        column = column * 26 + (upper - 'A' + 1);
    }
    return letters == 0 ? -1 : column - 1;
}

Table SheetReader::fromRows(std::vector<std::vector<std::string>> rows) {
    Table table;
    if (rows.empty()) {
        return table;
    }

    size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.size());
    }

    table.headers = std::move(rows.front());
    table.headers.resize(width);
    for (size_t i = 1; i < rows.size(); ++i) {
        rows[i].resize(width);
        table.rows.push_back(std::move(rows[i]));
    }
    return table;
}

Table SheetReader::read(const std::string& path) {
    if (!utils::FileUtils::fileExists(path)) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Export artifact not found", path);
    }
    if (utils::StringUtils::toLowerCase(os::PathUtils::getExtension(path)) == ".xlsx") {
        return readWorkbook(path);
    }

    std::string text;
    if (!utils::FileUtils::readFileToString(path, text)) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Export artifact unreadable", path);
    }
    return parseDelimited(text);
}

Table SheetReader::readWorkbook(const std::string& path) {
    SCOPED_TIMER("SheetReader::readWorkbook");

    std::string bytes;
    if (!utils::FileUtils::readFileToString(path, bytes)) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Export artifact unreadable", path);
    }

    try {
        ZipArchive archive(std::move(bytes));
        std::vector<std::string> sharedStrings = readSharedStrings(archive);
        std::string sheetPart = firstWorksheetPart(archive);

        XmlDocPtr doc = parseXml(archive.extract(sheetPart), sheetPart);
        const xmlNode* sheetData = firstChild(xmlDocGetRootElement(doc.get()), "sheetData");

        std::vector<std::vector<std::string>> rows;
        for (const xmlNode* row = sheetData ? sheetData->children : nullptr; row; row = row->next) {
            if (!isElement(row, "row")) {
                continue;
            }
            std::vector<std::string> cells;
            for (const xmlNode* cell = row->children; cell; cell = cell->next) {
                if (!isElement(cell, "c")) {
                    continue;
                }
                int column = columnFromReference(attribute(cell, "r"));
                size_t position = column < 0 ? cells.size() : static_cast<size_t>(column);
                if (position >= cells.size()) {
                    cells.resize(position + 1);
                }
                cells[position] = cellText(cell, sharedStrings);
            }
            rows.push_back(std::move(cells));
        }

        Table table = fromRows(std::move(rows));
        SLOG_DEBUG().message("Workbook read")
            .context("path", path)
            .context("sheet", sheetPart)
            .context("columns", table.headers.size())
            .context("rows", table.rows.size());
        return table;
    } catch (const AutomationError& e) {
        const ErrorInfo& info = e.getErrorInfo();
        throw AutomationError(info.type, info.message, info.details, path);
    }
}

Table SheetReader::parseDelimited(const std::string& text) {
    std::string body = text;
    if (utils::StringUtils::startsWith(body, "\xEF\xBB\xBF")) {
        body = body.substr(3);
    }

    std::vector<std::string> lines;
    for (auto& line : utils::StringUtils::split(body, "\n")) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (lines.empty() && utils::StringUtils::trim(line).empty()) {
            continue;
        }
        lines.push_back(line);
    }
    while (!lines.empty() && utils::StringUtils::trim(lines.back()).empty()) {
        lines.pop_back();
    }
    if (lines.empty()) {
        return Table();
    }

    std::string delimiter = ",";
    if (lines.front().find('\t') != std::string::npos) {
        delimiter = "\t";
    } else if (lines.front().find(';') != std::string::npos) {
        delimiter = ";";
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& line : lines) {
        std::vector<std::string> cells = utils::StringUtils::split(line, delimiter);
        for (auto& cell : cells) {
            cell = utils::StringUtils::trim(cell);
        }
        rows.push_back(std::move(cells));
    }
    return fromRows(std::move(rows));
}

} // namespace spreadsheet
} // namespace exportflow
