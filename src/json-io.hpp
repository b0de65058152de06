/**
 * JSON wire format of the snapshot documents, the summary and the compute
 * options, built on nlohmann::json.
 *
 * Input keys follow the stored snapshot documents. Missing keys take the
 * data model defaults through json::value(); a present key of the wrong
 * type, or an unknown enum string, throws.
 */

#ifndef CUTLIST_JSON_IO_HPP
#define CUTLIST_JSON_IO_HPP

#include <nlohmann/json.hpp>

#include "cost-export.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "types.hpp"

namespace cutlist {

using json = nlohmann::json;

OptimizationPriority parsePriority(const std::string& text);
/** Also accepts the 16mm, 32mm-backer and 32mm-both names of older documents. */
LaminationType parseLaminationType(const std::string& text);
BillingMode parseBillingMode(const std::string& text);

void to_json(json& j, const Part& part);
void from_json(const json& j, Part& part);
void to_json(json& j, const BoardMaterial& board);
void from_json(const json& j, BoardMaterial& board);
void to_json(json& j, const EdgingMaterial& edging);
void from_json(const json& j, EdgingMaterial& edging);
void to_json(json& j, const SheetBillingOverride& entry);
void from_json(const json& j, SheetBillingOverride& entry);

/** Writes `version: 2` along with the snapshot fields. */
void to_json(json& j, const InputSnapshot& snapshot);
/** Reads the fields only; version checks belong to the store. */
void from_json(const json& j, InputSnapshot& snapshot);

void to_json(json& j, const Placement& placement);
void to_json(json& j, const SheetLayout& sheet);
void to_json(json& j, const MaterialLayout& layout);
void to_json(json& j, const EdgingSummaryEntry& entry);
void to_json(json& j, const CutlistSummary& summary);

void to_json(json& j, const ValidationError& error);
void to_json(json& j, const ExportLine& line);

/**
 * Options object of the CLI: deepIterations, deepTimeBudgetMs, seed. The
 * optional logLevel is returned through `level` when present and valid.
 */
ComputeOptions optionsFromJson(const json& j, LogLevel& level);

} // namespace cutlist

#endif // CUTLIST_JSON_IO_HPP
