#include "csv-import.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace cutlist {

namespace {

enum class Column {
    No,
    Designation,
    Quantity,
    Length,
    Width,
    Thickness,
    MaterialType,
    MaterialName,
    EdgeLength1,
    EdgeLength2,
    EdgeWidth1,
    EdgeWidth2,
    Tags
};

const std::map<std::string, Column> kHeaders = {
    {"no.", Column::No},
    {"no", Column::No},
    {"designation", Column::Designation},
    {"quantity", Column::Quantity},
    {"length", Column::Length},
    {"length - raw", Column::Length},
    {"width", Column::Width},
    {"width - raw", Column::Width},
    {"thickness", Column::Thickness},
    {"thickness - raw", Column::Thickness},
    {"material type", Column::MaterialType},
    {"material name", Column::MaterialName},
    {"edge length 1", Column::EdgeLength1},
    {"edge length 2", Column::EdgeLength2},
    {"edge width 1", Column::EdgeWidth1},
    {"edge width 2", Column::EdgeWidth2},
    {"tags", Column::Tags},
};

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void eraseAll(std::string& text, const std::string& needle) {
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle)) {
        text.erase(pos, needle.size());
    }
}

/**
 * Non-empty lines with the byte order mark and CR line ends removed.
 */
std::vector<std::string> splitLines(const std::string& content) {
    std::string text = content;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }

    std::vector<std::string> lines;
    std::string line;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        char c = i < text.size() ? text[i] : '\n';
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            if (!trim(line).empty()) {
                lines.push_back(line);
            }
            line.clear();
        } else {
            line += c;
        }
    }
    return lines;
}

/** Like parseInt: the leading integer, 1 when there is none or it is zero. */
int parseQuantity(const std::string& text) {
    std::string cleaned = trim(text);
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(cleaned.c_str(), &end, 10);
    if (end == cleaned.c_str() || errno == ERANGE || value == 0) {
        return 1;
    }
    return static_cast<int>(std::max<long>(std::min<long>(value, 1000000), -1000000));
}

const BoardMaterial* matchBoard(const std::vector<BoardMaterial>& boards,
                                const std::string& materialName) {
    std::string wanted = lower(materialName);
    auto it = std::find_if(boards.begin(), boards.end(), [&wanted](const BoardMaterial& board) {
        return lower(board.name) == wanted || lower(board.id) == wanted;
    });
    return it == boards.end() ? nullptr : &*it;
}

} // namespace

char detectDelimiter(const std::string& headerLine) {
    auto semicolons = std::count(headerLine.begin(), headerLine.end(), ';');
    auto commas = std::count(headerLine.begin(), headerLine.end(), ',');
    return semicolons >= commas ? ';' : ',';
}

std::vector<std::string> splitCsvLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter) {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(trim(current));
    return fields;
}

double parseDimension(const std::string& text) {
    std::string cleaned = text;
    // "mm" suffix in any case
    for (auto pos = lower(cleaned).find("mm"); pos != std::string::npos;
         pos = lower(cleaned).find("mm")) {
        cleaned.erase(pos, 2);
    }
    cleaned = trim(cleaned);

    if (cleaned.find(',') != std::string::npos && cleaned.find('.') == std::string::npos) {
        cleaned[cleaned.find(',')] = '.';
    }

    // Digit group separators: spaces, no-break and thin spaces
    eraseAll(cleaned, "\xC2\xA0");
    eraseAll(cleaned, "\xE2\x80\x89");
    cleaned.erase(std::remove_if(cleaned.begin(), cleaned.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  cleaned.end());

    char* end = nullptr;
    double value = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || !std::isfinite(value) || value < 0.0) {
        return 0.0;
    }
    return value;
}

CsvImport importSketchUpCsv(const std::string& content, const std::vector<BoardMaterial>& boards) {
    std::vector<std::string> lines = splitLines(content);
    if (lines.empty()) {
        throw std::invalid_argument("CSV file is empty");
    }

    const char delimiter = detectDelimiter(lines[0]);
    std::vector<std::string> headers = splitCsvLine(lines[0], delimiter);

    CsvImport result;
    std::map<Column, std::size_t> columns;
    std::vector<std::string> unmapped;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        auto it = kHeaders.find(lower(headers[i]));
        if (it == kHeaders.end()) {
            if (!headers[i].empty()) {
                unmapped.push_back(headers[i]);
            }
            continue;
        }
        // The first of repeated headers wins
        columns.emplace(it->second, i);
    }

    std::string missing;
    const std::pair<Column, const char*> required[] = {
        {Column::Length, "length"}, {Column::Width, "width"}, {Column::Quantity, "quantity"}};
    for (const auto& column : required) {
        if (columns.count(column.first) == 0) {
            missing += missing.empty() ? column.second : std::string(", ") + column.second;
        }
    }
    if (!missing.empty()) {
        throw std::invalid_argument("CSV is missing required columns: " + missing);
    }

    if (!unmapped.empty()) {
        std::ostringstream message;
        message << "Unmapped columns: ";
        for (std::size_t i = 0; i < unmapped.size(); ++i) {
            message << (i == 0 ? "" : ", ") << unmapped[i];
        }
        result.warnings.push_back(CsvRowIssue{0, message.str()});
    }

    struct Row {
        int number;
        std::vector<std::string> fields;
    };
    std::vector<Row> rows;
    std::vector<Row> sheetGoods;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        Row row{static_cast<int>(i), splitCsvLine(lines[i], delimiter)};
        rows.push_back(row);

        auto type = columns.find(Column::MaterialType);
        std::string materialType =
            type != columns.end() && type->second < row.fields.size() ? row.fields[type->second]
                                                                      : std::string();
        if (materialType.empty() || lower(materialType) == "sheet goods") {
            sheetGoods.push_back(std::move(row));
        }
    }
    if (sheetGoods.empty() && !rows.empty()) {
        result.warnings.push_back(
            CsvRowIssue{0, "No \"Sheet Goods\" rows found, importing all rows"});
        sheetGoods = rows;
    }

    std::set<std::string> usedIds;
    for (const auto& row : sheetGoods) {
        auto value = [&](Column column) {
            auto it = columns.find(column);
            if (it == columns.end() || it->second >= row.fields.size()) {
                return std::string();
            }
            return row.fields[it->second];
        };

        Part part;
        part.length_mm = parseDimension(value(Column::Length));
        part.width_mm = parseDimension(value(Column::Width));
        part.quantity = parseQuantity(value(Column::Quantity));

        bool valid = true;
        auto reject = [&](const char* message) {
            result.errors.push_back(CsvRowIssue{row.number, message});
            valid = false;
        };
        if (!(part.length_mm > 0.0)) {
            reject("Invalid or missing length");
        }
        if (!(part.width_mm > 0.0)) {
            reject("Invalid or missing width");
        }
        if (part.quantity <= 0) {
            reject("Invalid or missing quantity");
        }
        if (!valid) {
            continue;
        }

        double thickness = parseDimension(value(Column::Thickness));
        if (thickness > 0.0) {
            part.thickness_mm = thickness;
        } else {
            result.warnings.push_back(CsvRowIssue{row.number, "No thickness specified"});
        }

        std::string materialName = value(Column::MaterialName);
        if (materialName.empty()) {
            result.warnings.push_back(CsvRowIssue{row.number, "No material name"});
        } else if (!boards.empty()) {
            if (const BoardMaterial* board = matchBoard(boards, materialName)) {
                part.material_id = board->id;
            } else {
                result.warnings.push_back(CsvRowIssue{
                    row.number, "Material '" + materialName + "' matches no board"});
            }
        }

        part.label = value(Column::Designation);
        if (part.label.empty()) {
            result.warnings.push_back(CsvRowIssue{row.number, "No designation/name"});
        }

        std::string id = value(Column::No);
        if (id.empty() || usedIds.count(id) != 0) {
            std::string base = id.empty() ? "row-" + std::to_string(row.number) : id;
            id = base;
            for (int suffix = 2; usedIds.count(id) != 0; ++suffix) {
                id = base + "-" + std::to_string(suffix);
            }
        }
        usedIds.insert(id);
        part.id = id;

        part.grain_locked = true;
        part.edge(Edge::Top).banded = !value(Column::EdgeLength1).empty();
        part.edge(Edge::Bottom).banded = !value(Column::EdgeLength2).empty();
        part.edge(Edge::Right).banded = !value(Column::EdgeWidth1).empty();
        part.edge(Edge::Left).banded = !value(Column::EdgeWidth2).empty();

        result.parts.push_back(std::move(part));
    }

    logInfo("Imported ", result.parts.size(), " part(s) from ", rows.size(), " CSV row(s), ",
            result.errors.size(), " rejected");
    return result;
}

} // namespace cutlist
