#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "config/ingest_config.hpp"
#include "core/image_types.hpp"
#include "core/image_validator.hpp"
#include "core/image_transcoder.hpp"
#include "core/ingest_errors.hpp"
#include "core/responsive_set_generator.hpp"
#include "core/thumbnail_generator.hpp"
#include "database/asset_rules.hpp"
#include "database/metadata_store.hpp"
#include "storage/object_store.hpp"

/**
 * @brief Settings the pipeline reads on every ingestion
 */
struct PipelineConfig
{
    ValidatorConfig validation;
    std::vector<std::string> allowed_mime_types = AssetRules::mimeTypes();
    TranscodeOptions primary;
    ThumbnailSize thumbnail_size = ThumbnailSize::medium();
    EncodeOptions thumbnail;
    ThumbnailStrategy thumbnail_strategy = ThumbnailStrategy::UPLOAD;
    std::vector<int> responsive_widths = ResponsiveSetGenerator::defaultWidths();
    EncodeOptions responsive;

    static PipelineConfig fromConfig(const IngestConfig &config);
};

/**
 * @brief Orchestrates validation, transcoding, storage and persistence
 *
 * ingest() runs strictly in order: validate, transcode the primary,
 * derive the key, build the thumbnail, upload, persist. A failure before
 * the first upload leaves nothing behind. A failure after it removes
 * every object uploaded so far before the error is raised.
 *
 * The pipeline holds references to its collaborators; both must outlive it.
 * Concurrent ingest() calls share no state beyond those collaborators.
 */
class IngestionPipeline
{
public:
    IngestionPipeline(ObjectStore &store, MetadataStore &metadata, PipelineConfig config = PipelineConfig());

    /**
     * @brief Validate, transform, store and record one upload
     * @param upload Raw bytes with the caller's declared MIME type
     * @param fields Caller-declared title, alt text, category, priority
     * @return The persisted record
     * @throws ValidationError with every field and image problem found
     * @throws DecodeError, EncodeError if a transform fails
     * @throws StorageError if an upload fails; earlier uploads are removed
     * @throws PersistenceError if the record cannot be stored; uploads are removed
     */
    ImageAsset ingest(const RawUpload &upload, const AssetFields &fields);

    /**
     * @brief Patch the editable fields of an active record
     *
     * Images are not touched.
     *
     * @throws ValidationError if a patched field breaks a field rule
     * @throws NotFoundError if no active record has this id
     * @throws PersistenceError if the store rejects the update
     */
    ImageAsset updateMetadata(int64_t id, const AssetPatch &patch);

    /**
     * @brief Soft or permanent delete of an active record
     *
     * Soft delete clears the active flag and keeps the stored objects.
     * Permanent delete removes the stored objects (failures are logged
     * and ignored) and then always removes the record.
     *
     * @return The record as it was before a permanent delete, or after a soft one
     * @throws NotFoundError if no active record has this id
     * @throws PersistenceError if the store rejects the change
     */
    ImageAsset deleteAsset(int64_t id, bool permanent = false);

    const PipelineConfig &config() const { return config_; }

private:
    void validate(const RawUpload &upload, const AssetFields &fields) const;
    CompensationOutcome compensate(const std::vector<std::string> &keys);

    ObjectStore &store_;
    MetadataStore &metadata_;
    PipelineConfig config_;
    ImageValidator validator_;
};
