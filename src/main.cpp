#include "config/ingest_config.hpp"
#include "core/asset_catalog.hpp"
#include "core/asset_json.hpp"
#include "core/image_probe.hpp"
#include "core/image_utils.hpp"
#include "core/ingestion_pipeline.hpp"
#include "database/sqlite_metadata_store.hpp"
#include "storage/filesystem_object_store.hpp"
#include "storage/http_object_store.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{
    const int EXIT_OK = 0;
    const int EXIT_REJECTED = 1; // validation, not found, bad usage
    const int EXIT_FAILED = 2;

    struct CommandLine
    {
        std::string command;
        std::vector<std::string> positional;
        std::map<std::string, std::string> options;
        std::set<std::string> flags;

        bool has(const std::string &name) const { return options.count(name) > 0; }
        std::string get(const std::string &name, const std::string &def = "") const
        {
            auto it = options.find(name);
            return it == options.end() ? def : it->second;
        }
    };

    // Options that never take a value
    const std::set<std::string> FLAG_OPTIONS = {"--featured", "--permanent", "--no-webp", "--help", "-h"};

    const std::set<std::string> LOCAL_COMMANDS = {"probe", "responsive", "optimize"};
    const std::set<std::string> STORE_COMMANDS = {"ingest", "update", "delete", "get", "list",
                                                  "categories", "stats", "bulk-update"};

    void printUsage(const char *program)
    {
        std::cout << "Media Ingest - image ingestion pipeline" << std::endl;
        std::cout << "Usage: " << program << " <command> [arguments] [--config <path>]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  ingest <file> --title T --alt A [--description D] [--category C] [--priority N] [--mime M]" << std::endl;
        std::cout << "  update <id> [--title T] [--description D] [--alt A] [--category C] [--priority N] [--active true|false]" << std::endl;
        std::cout << "  delete <id> [--permanent]" << std::endl;
        std::cout << "  get <id>" << std::endl;
        std::cout << "  list [--category C] [--sort recent|oldest|priority|title] [--page N] [--limit N] [--featured]" << std::endl;
        std::cout << "  categories" << std::endl;
        std::cout << "  stats" << std::endl;
        std::cout << "  bulk-update <id,id,...> [--title T] [--category C] [--priority N] [--active true|false] ..." << std::endl;
        std::cout << "  responsive <file> <out_dir> [--widths 400,800]" << std::endl;
        std::cout << "  optimize <file> <out_dir> [--no-webp]" << std::endl;
        std::cout << "  probe <file>" << std::endl;
    }

    bool parseCommandLine(int argc, char *argv[], CommandLine &cmd, std::string &error)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (FLAG_OPTIONS.count(arg))
            {
                cmd.flags.insert(arg);
            }
            else if (arg.rfind("--", 0) == 0)
            {
                if (i + 1 >= argc)
                {
                    error = "Missing value for " + arg;
                    return false;
                }
                cmd.options[arg] = argv[++i];
            }
            else if (cmd.command.empty())
            {
                cmd.command = arg;
            }
            else
            {
                cmd.positional.push_back(arg);
            }
        }
        return true;
    }

    int64_t parseInteger(const std::string &value, const std::string &name)
    {
        size_t start = (!value.empty() && (value[0] == '-' || value[0] == '+')) ? 1 : 0;
        if (value.size() == start || value.size() - start > 18 ||
            value.find_first_not_of("0123456789", start) != std::string::npos)
        {
            throw ValidationError({"Invalid " + name + ": " + value});
        }
        return std::stoll(value);
    }

    int parseBoundedInt(const std::string &value, const std::string &name)
    {
        int64_t parsed = parseInteger(value, name);
        if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max())
            throw ValidationError({"Invalid " + name + ": " + value});
        return static_cast<int>(parsed);
    }

    bool parseBool(const std::string &value, const std::string &name)
    {
        if (value == "true" || value == "1")
            return true;
        if (value == "false" || value == "0")
            return false;
        throw ValidationError({"Invalid " + name + ": " + value});
    }

    std::vector<uint8_t> readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            throw std::runtime_error("Cannot open " + path);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    void writeFile(const fs::path &path, const std::vector<uint8_t> &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            throw std::runtime_error("Cannot write " + path.string());
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out)
            throw std::runtime_error("Short write to " + path.string());
    }

    // What a browser would declare for the file, judged by its name only
    std::string declaredMimeType(const std::string &path)
    {
        std::string ext = fs::path(path).extension().string();
        if (!ext.empty() && ext[0] == '.')
            ext = ext.substr(1);
        ImageFormat format = ImageFormats::fromString(ext);
        return format == ImageFormat::UNKNOWN ? "application/octet-stream" : ImageFormats::getMimeType(format);
    }

    std::unique_ptr<ObjectStore> makeObjectStore(const StorageSettings &settings)
    {
        if (settings.backend == "http")
        {
            return std::make_unique<HttpObjectStore>(settings.http_endpoint, settings.http_base_path, settings.http_token,
                                                     settings.public_base_url, settings.http_timeout_seconds);
        }
        return std::make_unique<FilesystemObjectStore>(settings.root_dir, settings.public_base_url);
    }

    AssetPatch patchFromOptions(const CommandLine &cmd)
    {
        AssetPatch patch;
        if (cmd.has("--title"))
            patch.title = cmd.get("--title");
        if (cmd.has("--description"))
            patch.description = cmd.get("--description");
        if (cmd.has("--alt"))
            patch.alt = cmd.get("--alt");
        if (cmd.has("--category"))
            patch.category = cmd.get("--category");
        if (cmd.has("--priority"))
            patch.priority = parseBoundedInt(cmd.get("--priority"), "priority");
        if (cmd.has("--active"))
            patch.is_active = parseBool(cmd.get("--active"), "active");
        return patch;
    }

    void requirePositional(const CommandLine &cmd, size_t count)
    {
        if (cmd.positional.size() < count)
            throw ValidationError({"Missing arguments for " + cmd.command});
    }

    void printSuccess(const json &data, const std::string &message = "")
    {
        json body = {{"success", true}, {"data", data}};
        if (!message.empty())
            body["message"] = message;
        std::cout << body.dump(2) << std::endl;
    }

    /**
     * @brief Commands that only transform local files; nothing is stored
     */
    int runLocalCommand(const CommandLine &cmd, const IngestConfig &config)
    {
        requirePositional(cmd, 1);
        std::vector<uint8_t> data = readFile(cmd.positional[0]);

        if (cmd.command == "probe")
        {
            printSuccess(ImageProbe::extractMetadata(data));
            return EXIT_OK;
        }

        requirePositional(cmd, 2);
        fs::path out_dir = cmd.positional[1];
        fs::create_directories(out_dir);
        std::string stem = fs::path(cmd.positional[0]).stem().string();

        ImageValidator validator(config.validatorConfig());
        ValidationResult validation = validator.validate(data);
        if (!validation.isValid())
            throw ValidationError(validation.reasons);

        json files = json::array();
        auto emit = [&](const ProcessedVariant &variant, const std::string &suffix)
        {
            fs::path target = out_dir / (stem + suffix + "." + ImageFormats::getExtension(variant.format));
            writeFile(target, variant.data);
            files.push_back({{"path", target.string()},
                             {"width", variant.width},
                             {"height", variant.height},
                             {"size", variant.size()},
                             {"compressionRatio", ImageUtils::compressionRatio(data.size(), variant.size())}});
        };

        if (cmd.command == "responsive")
        {
            std::vector<int> widths = cmd.has("--widths") ? IngestConfig::parseWidths(cmd.get("--widths"))
                                                          : config.responsiveWidths();
            if (widths.empty())
                throw ValidationError({"Invalid widths: " + cmd.get("--widths")});

            for (const auto &variant : ResponsiveSetGenerator::responsiveSet(data, widths, config.responsiveOptions()))
                emit(variant.image, "-" + std::to_string(variant.width) + "w");
        }
        else
        {
            WebOptimizedImage optimized = ImageTranscoder::optimizeForWeb(data, 1200, 1200, 85, !cmd.flags.count("--no-webp"));
            emit(optimized.jpeg, "-web");
            if (optimized.webp)
                emit(*optimized.webp, "-web");
        }
        printSuccess(json{{"files", files}});
        return EXIT_OK;
    }

    int runStoreCommand(const CommandLine &cmd, const IngestConfig &config)
    {
        SqliteMetadataStore metadata(config.databasePath());
        std::unique_ptr<ObjectStore> store = makeObjectStore(config.storageSettings());
        IngestionPipeline pipeline(*store, metadata, PipelineConfig::fromConfig(config));
        AssetCatalog catalog(metadata);

        if (cmd.command == "ingest")
        {
            requirePositional(cmd, 1);
            RawUpload upload;
            upload.filename = fs::path(cmd.positional[0]).filename().string();
            upload.data = readFile(cmd.positional[0]);
            upload.mime_type = cmd.get("--mime", declaredMimeType(cmd.positional[0]));

            AssetFields fields;
            fields.title = cmd.get("--title");
            fields.description = cmd.get("--description");
            fields.alt = cmd.get("--alt");
            if (cmd.has("--category"))
                fields.category = cmd.get("--category");
            if (cmd.has("--priority"))
                fields.priority = parseBoundedInt(cmd.get("--priority"), "priority");

            printSuccess(json{{"image", pipeline.ingest(upload, fields)}}, "Image uploaded successfully");
        }
        else if (cmd.command == "update")
        {
            requirePositional(cmd, 1);
            ImageAsset asset = pipeline.updateMetadata(parseInteger(cmd.positional[0], "id"), patchFromOptions(cmd));
            printSuccess(json{{"image", asset}}, "Image updated successfully");
        }
        else if (cmd.command == "delete")
        {
            requirePositional(cmd, 1);
            bool permanent = cmd.flags.count("--permanent") > 0;
            ImageAsset asset = pipeline.deleteAsset(parseInteger(cmd.positional[0], "id"), permanent);
            printSuccess(json{{"image", asset}}, permanent ? "Image permanently deleted" : "Image deleted successfully");
        }
        else if (cmd.command == "get")
        {
            requirePositional(cmd, 1);
            int64_t id = parseInteger(cmd.positional[0], "id");
            auto asset = catalog.get(id);
            if (!asset)
                throw NotFoundError(id);
            printSuccess(json{{"image", *asset}});
        }
        else if (cmd.command == "list")
        {
            AssetQuery query;
            query.category = cmd.get("--category", "all");
            query.sort = cmd.get("--sort", "recent");
            query.featured = cmd.flags.count("--featured") > 0;
            if (cmd.has("--page"))
                query.page = parseBoundedInt(cmd.get("--page"), "page");
            if (cmd.has("--limit"))
                query.limit = parseBoundedInt(cmd.get("--limit"), "limit");
            printSuccess(catalog.list(query));
        }
        else if (cmd.command == "categories")
        {
            printSuccess(json{{"categories", catalog.categories()}});
        }
        else if (cmd.command == "stats")
        {
            printSuccess(json{{"stats", catalog.stats()}});
        }
        else if (cmd.command == "bulk-update")
        {
            requirePositional(cmd, 1);
            std::vector<int64_t> ids;
            std::stringstream ss(cmd.positional[0]);
            std::string token;
            while (std::getline(ss, token, ','))
            {
                if (!token.empty())
                    ids.push_back(parseInteger(token, "id"));
            }
            BulkUpdateResult result = catalog.bulkUpdate(ids, patchFromOptions(cmd));
            printSuccess(result, std::to_string(result.modified) + " images updated successfully");
        }
        else
        {
            throw ValidationError({"Unknown command: " + cmd.command});
        }
        return EXIT_OK;
    }
}

int main(int argc, char *argv[])
{
    CommandLine cmd;
    std::string parse_error;
    if (!parseCommandLine(argc, argv, cmd, parse_error))
    {
        std::cerr << parse_error << std::endl;
        printUsage(argv[0]);
        return EXIT_REJECTED;
    }
    if (cmd.flags.count("--help") || cmd.flags.count("-h"))
    {
        printUsage(argv[0]);
        return EXIT_OK;
    }
    if (cmd.command.empty() || (!LOCAL_COMMANDS.count(cmd.command) && !STORE_COMMANDS.count(cmd.command)))
    {
        if (!cmd.command.empty())
            std::cerr << "Unknown command: " << cmd.command << std::endl;
        printUsage(argv[0]);
        return EXIT_REJECTED;
    }

    IngestConfig config;
    std::string config_path = cmd.get("--config", "config.json");
    if (!config.load(config_path) && cmd.has("--config"))
    {
        std::cerr << "Failed to load configuration from " << config_path << std::endl;
        return EXIT_FAILED;
    }
    Logger::init(config.logLevel());
    for (const auto &key : config.unknownKeys())
        Logger::warn("Ignoring unknown configuration key: " + key);
    if (!config.validateConfig())
    {
        std::cerr << "Invalid configuration, see log for details" << std::endl;
        return EXIT_FAILED;
    }

    try
    {
        if (LOCAL_COMMANDS.count(cmd.command))
            return runLocalCommand(cmd, config);
        return runStoreCommand(cmd, config);
    }
    catch (const ValidationError &e)
    {
        std::cout << errorToJson(e).dump(2) << std::endl;
        return EXIT_REJECTED;
    }
    catch (const NotFoundError &e)
    {
        std::cout << errorToJson(e).dump(2) << std::endl;
        return EXIT_REJECTED;
    }
    catch (const IngestionError &e)
    {
        std::cout << errorToJson(e).dump(2) << std::endl;
        return EXIT_FAILED;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Command failed: ") + e.what());
        std::cout << json{{"success", false}, {"message", e.what()}}.dump(2) << std::endl;
        return EXIT_FAILED;
    }
}
