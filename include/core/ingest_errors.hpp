#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Base class for every failure surfaced by the ingestion core
 */
class IngestionError : public std::runtime_error
{
public:
    explicit IngestionError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Upload rejected before any transform or storage work
 */
class ValidationError : public IngestionError
{
public:
    explicit ValidationError(std::vector<std::string> reasons)
        : IngestionError(buildMessage(reasons)), reasons_(std::move(reasons)) {}

    const std::vector<std::string> &reasons() const { return reasons_; }

private:
    static std::string buildMessage(const std::vector<std::string> &reasons)
    {
        std::string message = "Validation failed";
        for (size_t i = 0; i < reasons.size(); ++i)
        {
            message += (i == 0 ? ": " : "; ");
            message += reasons[i];
        }
        return message;
    }

    std::vector<std::string> reasons_;
};

class DecodeError : public IngestionError
{
public:
    explicit DecodeError(const std::string &message) : IngestionError(message) {}
};

class EncodeError : public IngestionError
{
public:
    explicit EncodeError(const std::string &message) : IngestionError(message) {}
};

/**
 * @brief Record of a compensating delete run after a later step failed
 */
struct CompensationOutcome
{
    bool attempted = false;
    bool succeeded = false;
    std::vector<std::string> keys; // Storage keys the cleanup targeted
    std::string error_message;     // First cleanup failure, empty on success
};

/**
 * @brief Object store I/O failure
 *
 * When the failure came after other objects of the same ingest were
 * stored, the compensation records the cleanup of those objects.
 */
class StorageError : public IngestionError
{
public:
    StorageError(const std::string &message, const std::string &key,
                 const CompensationOutcome &compensation = CompensationOutcome())
        : IngestionError(message), key_(key), compensation_(compensation) {}

    const std::string &key() const { return key_; }
    const CompensationOutcome &compensation() const { return compensation_; }

private:
    std::string key_;
    CompensationOutcome compensation_;
};

/**
 * @brief Metadata store failure after the object store write succeeded
 *
 * The cause is the database error; the compensation records what
 * happened to the already uploaded objects.
 */
class PersistenceError : public IngestionError
{
public:
    PersistenceError(const std::string &cause, const CompensationOutcome &compensation)
        : IngestionError("Failed to persist image asset: " + cause),
          cause_(cause), compensation_(compensation) {}

    const std::string &cause() const { return cause_; }
    const CompensationOutcome &compensation() const { return compensation_; }

private:
    std::string cause_;
    CompensationOutcome compensation_;
};

class NotFoundError : public IngestionError
{
public:
    explicit NotFoundError(int64_t id)
        : IngestionError("Image asset not found: " + std::to_string(id)), id_(id) {}

    int64_t id() const { return id_; }

private:
    int64_t id_;
};
