/**
 * Import of part lists from SketchUp cutlist CSV exports.
 *
 * The export is semicolon separated by default; a comma separated file is
 * recognised from its header line. Columns are matched by header name,
 * case-insensitively, and only length, width and quantity are required.
 * Rows whose material type is "Sheet Goods" (or empty) become parts; a file
 * without such rows imports every row.
 */

#ifndef CUTLIST_CSV_IMPORT_HPP
#define CUTLIST_CSV_IMPORT_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace cutlist {

struct CsvRowIssue {
    /** Data row, 1-based and not counting the header; 0 for the whole file. */
    int row = 0;
    std::string message;
};

struct CsvImport {
    std::vector<Part> parts;
    /** Rows left out of `parts`. */
    std::vector<CsvRowIssue> errors;
    std::vector<CsvRowIssue> warnings;
};

/** ';' unless the header line holds more commas than semicolons. */
char detectDelimiter(const std::string& headerLine);

/** Fields of one line; double quotes group a field and "" is a literal quote. */
std::vector<std::string> splitCsvLine(const std::string& line, char delimiter);

/**
 * Millimetres from text such as "716 mm" or "716,5". Returns 0 for text that
 * holds no number or a negative one.
 */
double parseDimension(const std::string& text);

/**
 * Parts from a SketchUp cutlist export. Edge columns map length 1 to top,
 * length 2 to bottom, width 1 to right and width 2 to left; any text marks
 * the edge banded. Parts keep their grain. A material name matching a board
 * of `boards` by name or id selects that board.
 *
 * Throws std::invalid_argument for an empty file or one missing a required
 * column.
 */
CsvImport importSketchUpCsv(const std::string& content,
                            const std::vector<BoardMaterial>& boards = {});

} // namespace cutlist

#endif // CUTLIST_CSV_IMPORT_HPP
