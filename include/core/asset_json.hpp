#pragma once

#include <nlohmann/json.hpp>
#include "core/asset_catalog.hpp"
#include "core/image_types.hpp"
#include "core/ingest_errors.hpp"
#include "database/metadata_store.hpp"

// nlohmann::json conversions for the CLI and any other JSON-speaking caller.
// Field names follow the gallery API: camelCase, timestamps as ISO-8601 strings.

void to_json(nlohmann::json &j, const ImageAsset &asset);
void to_json(nlohmann::json &j, const Pagination &pagination);
void to_json(nlohmann::json &j, const AssetPage &page);
void to_json(nlohmann::json &j, const CategoryCount &count);
void to_json(nlohmann::json &j, const GalleryStats &stats);
void to_json(nlohmann::json &j, const BulkUpdateResult &result);
void to_json(nlohmann::json &j, const ImageMetadata &metadata);
void to_json(nlohmann::json &j, const CompensationOutcome &outcome);

/**
 * @brief Error body in the {success: false, message, errors} shape
 */
nlohmann::json errorToJson(const IngestionError &error);
