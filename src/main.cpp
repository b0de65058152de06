/**
 * cutlist-packer: cutting layout and costing CLI
 *
 * Usage: cutlist-packer [compute|export-lines] < input.json
 *        cutlist-packer import-csv < cutlist.csv
 *
 * Input: JSON via stdin with the snapshot and optional run options, or a
 * SketchUp cutlist CSV export (import-csv)
 * Output: JSON via stdout with the summary (compute), the costing lines
 * (export-lines) or the imported parts with row errors and warnings
 * (import-csv)
 *
 * Example input:
 * {
 *   "snapshot": {
 *     "parts": [
 *       {"id": "side", "length_mm": 720, "width_mm": 560, "quantity": 2,
 *        "band_edges": {"top": true}}
 *     ],
 *     "primaryBoards": [
 *       {"id": "white-16", "name": "White melamine 16mm", "sheet_length_mm": 2750,
 *        "sheet_width_mm": 1830, "cost_per_sheet": 950, "is_default": true}
 *     ],
 *     "edging": [
 *       {"id": "abs-16", "name": "ABS 16mm", "thickness_mm": 16, "cost_per_meter": 4.5,
 *        "is_default_for_thickness": true}
 *     ],
 *     "kerf": 3,
 *     "optimizationPriority": "offcut"
 *   },
 *   "options": {"deepIterations": 400, "deepTimeBudgetMs": 0, "seed": 20240611,
 *               "logLevel": "info", "includeLegacyBandLines": false}
 * }
 *
 * A bare snapshot object is accepted as input as well.
 */

#include <chrono>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "cost-export.hpp"
#include "csv-import.hpp"
#include "json-io.hpp"
#include "log.hpp"
#include "summary.hpp"

using namespace cutlist;

namespace {

struct Request {
    InputSnapshot snapshot;
    ComputeOptions options;
    ExportSettings exportSettings;
};

/**
 * Split the CLI input into snapshot and options
 */
Request parseRequest(const json& input) {
    if (!input.is_object()) {
        throw std::invalid_argument("input must be a JSON object");
    }

    const json& snapshotJson = input.contains("snapshot") ? input.at("snapshot") : input;
    if (snapshotJson.contains("version") && snapshotJson.at("version") != kSnapshotVersion) {
        throw std::invalid_argument("unsupported snapshot version " +
                                    snapshotJson.at("version").dump());
    }

    Request request;
    request.snapshot = snapshotJson.get<InputSnapshot>();

    const json options = input.value("options", json::object());
    LogLevel level = logLevel();
    request.options = optionsFromJson(options, level);
    setLogLevel(level);
    request.exportSettings.include_legacy_band_lines =
        options.value("includeLegacyBandLines", false);
    return request;
}

json failure(const ValidationError& error) {
    json result = error;
    result["success"] = false;
    return result;
}

/**
 * Main compute function
 */
json runCommand(const std::string& command, const json& input) {
    auto startTime = std::chrono::steady_clock::now();

    try {
        Request request = parseRequest(input);

        logInfo("Processing ", request.snapshot.parts.size(), " part(s) on ",
                request.snapshot.primary_boards.size(), " board(s)");
        logInfo("Kerf: ", request.snapshot.kerf_mm, "mm");
        logInfo("Strategy: ", priorityName(request.snapshot.priority));
        logInfo("Lamination: ", request.snapshot.lamination_enabled ? "enabled" : "disabled");

        auto computeStart = std::chrono::steady_clock::now();
        auto summary = compute(request.snapshot, request.options);
        auto computeDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - computeStart)
                                   .count();

        if (!summary) {
            logError(summary.error().describe());
            return failure(summary.error());
        }

        json result;
        result["success"] = true;
        if (command == "export-lines") {
            result["lines"] = buildExportLines(summary.value(), request.snapshot,
                                               request.exportSettings);
            result["lineRefs"] = request.snapshot.line_refs;
        } else {
            result["summary"] = summary.value();
        }
        result["timing"] = {
            {"computeMs", computeDuration}
        };

        auto totalDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - startTime)
                                 .count();
        result["timing"]["totalMs"] = totalDuration;

        logInfo("Total time: ", totalDuration, "ms");
        return result;

    } catch (const std::exception& e) {
        logError(e.what());
        return {
            {"success", false},
            {"error", e.what()}
        };
    }
}

json issuesToJson(const std::vector<CsvRowIssue>& issues) {
    json list = json::array();
    for (const auto& issue : issues) {
        list.push_back({{"row", issue.row}, {"message", issue.message}});
    }
    return list;
}

/**
 * Parts of a cutlist CSV as snapshot part objects
 */
json runImport(const std::string& content) {
    try {
        CsvImport imported = importSketchUpCsv(content);
        for (const auto& error : imported.errors) {
            logWarn("CSV row ", error.row, ": ", error.message);
        }
        return {
            {"success", true},
            {"parts", imported.parts},
            {"errors", issuesToJson(imported.errors)},
            {"warnings", issuesToJson(imported.warnings)}
        };
    } catch (const std::invalid_argument& e) {
        logError(e.what());
        return {
            {"success", false},
            {"error", e.what()}
        };
    }
}

} // namespace

int main(int argc, char* argv[]) {
    configureLogLevelFromEnv();

    try {
        std::string command = argc > 1 ? argv[1] : "compute";
        if (command != "compute" && command != "export-lines" && command != "import-csv") {
            throw std::invalid_argument("unknown command '" + command +
                                        "', expected compute, export-lines or import-csv");
        }

        json output;
        if (command == "import-csv") {
            std::string content((std::istreambuf_iterator<char>(std::cin)),
                                std::istreambuf_iterator<char>());
            output = runImport(content);
        } else {
            // Read JSON from stdin
            json input;
            std::cin >> input;
            output = runCommand(command, input);
        }

        // Write JSON to stdout
        std::cout << output.dump() << std::endl;

        return output["success"].get<bool>() ? 0 : 1;

    } catch (const std::exception& e) {
        logError("Fatal: ", e.what());

        json error = {
            {"success", false},
            {"error", std::string("Fatal error: ") + e.what()}
        };
        std::cout << error.dump() << std::endl;

        return 1;
    }
}
