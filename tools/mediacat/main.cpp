#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

#include <CLI/CLI.hpp>

#include <mediacat/app/catalog_service.h>
#include <mediacat/config/config.h>

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void setupLogging(const mediacat::config::MediacatConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (config.core.logFile) {
        std::error_code ec;
        std::filesystem::create_directories(config.core.logFile->parent_path(), ec);
        const size_t max_size = 10 * 1024 * 1024;
        const size_t max_files = 5;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.core.logFile->string(), max_size, max_files));
    }

    auto logger = std::make_shared<spdlog::logger>("mediacat", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.core.logLevel));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

int fail(const mediacat::Error& error) {
    std::cerr << "Error: " << error.message << " (" << mediacat::errorToString(error.code) << ")"
              << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace mediacat;

    CLI::App app{"mediacat - media ingestion and thumbnail cache"};
    app.require_subcommand(1);

    std::string config_path;
    std::string log_level;
    app.add_option("-c,--config", config_path, "Path to config.toml");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));

    auto* scan = app.add_subcommand("scan", "Scan every watched root once");
    auto* watch = app.add_subcommand("watch", "Scan, then follow filesystem changes");

    std::string ingest_path;
    auto* ingest = app.add_subcommand("ingest", "Catalog one file");
    ingest->add_option("path", ingest_path, "File to ingest")->required();

    std::string asset_checksum;
    std::string asset_kind = "thumb";
    std::optional<int> asset_size;
    bool asset_wait = false;
    auto* asset = app.add_subcommand("asset", "Get or build a thumbnail or preview");
    asset->add_option("checksum", asset_checksum, "Content checksum")->required();
    asset->add_option("-k,--kind", asset_kind, "thumb or preview")
        ->check(CLI::IsMember({"thumb", "thumbnail", "preview"}));
    asset->add_option("-s,--size", asset_size, "Bounding size in pixels");
    asset->add_flag("-w,--wait", asset_wait, "Wait for the build to finish");

    std::string purge_kind;
    auto* purge = app.add_subcommand("purge", "Delete every cached asset of a kind");
    purge->add_option("kind", purge_kind, "thumb or preview")
        ->required()
        ->check(CLI::IsMember({"thumb", "thumbnail", "preview"}));

    std::optional<int64_t> reprocess_location;
    std::string reprocess_dir;
    auto* reprocess = app.add_subcommand("reprocess", "Re-extract metadata");
    auto* locationOpt =
        reprocess->add_option("--location", reprocess_location, "Single location id");
    reprocess->add_option("--dir", reprocess_dir, "Every location in one directory")
        ->excludes(locationOpt);

    auto* rebuild = app.add_subcommand("rebuild-index", "Recreate the full-text search index");
    auto* vacuum = app.add_subcommand("vacuum", "Compact the database");

    auto* roots = app.add_subcommand("roots", "Manage watched roots");
    roots->require_subcommand(1);
    auto* rootsList = roots->add_subcommand("list", "List watched roots");
    std::string root_path;
    std::string root_tier = "restricted";
    auto* rootsAdd = roots->add_subcommand("add", "Register a watched root");
    rootsAdd->add_option("path", root_path, "Absolute directory path")->required();
    rootsAdd->add_option("-t,--tier", root_tier, "public or restricted")
        ->check(CLI::IsMember({"public", "restricted"}));
    auto* rootsRemove = roots->add_subcommand("remove", "Unregister a watched root");
    rootsRemove->add_option("path", root_path, "Root path")->required();
    bool unignore = false;
    auto* rootsIgnore = roots->add_subcommand("ignore", "Skip a root during scans");
    rootsIgnore->add_option("path", root_path, "Root path")->required();
    rootsIgnore->add_flag("--unset", unignore, "Stop ignoring the root");
    std::string root_tag;
    auto* rootsTag = roots->add_subcommand("tag", "Tag everything under a root");
    rootsTag->add_option("path", root_path, "Root path")->required();
    rootsTag->add_option("tag", root_tag, "Tag name")->required();

    std::string tag_checksum;
    std::string tag_name;
    auto* tag = app.add_subcommand("tag", "Tag one content");
    tag->add_option("checksum", tag_checksum, "Content checksum")->required();
    tag->add_option("tag", tag_name, "Tag name")->required();

    LocationId location_id = 0;
    bool restore = false;
    auto* trash = app.add_subcommand("trash", "Move a location to the trash");
    trash->add_option("location-id", location_id, "Location id")->required();
    trash->add_flag("--restore", restore, "Take the location out of the trash");

    auto* del = app.add_subcommand("delete", "Delete a location's file permanently");
    del->add_option("location-id", location_id, "Location id")->required();

    auto* stats = app.add_subcommand("stats", "Show catalog counters");

    CLI11_PARSE(app, argc, argv);

    auto loaded = config::loadConfig(config_path);
    if (!loaded)
        return fail(loaded.error());
    config::MediacatConfig cfg = std::move(loaded).value();
    if (!log_level.empty())
        cfg.core.logLevel = log_level;

    try {
        setupLogging(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    app::CatalogService service(cfg);
    if (auto init = service.initialize(); !init)
        return fail(init.error());

    if (scan->parsed() || watch->parsed()) {
        auto result = service.scanAll();
        if (!result)
            return fail(result.error());
        const auto& s = result.value();
        std::cout << "Scanned " << s.rootsScanned << " roots: " << s.filesSeen << " files, "
                  << s.newFiles << " new, " << s.newDirectories << " new directories, "
                  << s.errors << " errors in " << s.duration.count() << " ms" << std::endl;
        if (scan->parsed())
            return 0;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        if (auto started = service.startWatching(); !started)
            return fail(started.error());

        spdlog::info("Watching for changes, press Ctrl+C to stop");
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        spdlog::info("Shutting down");
        service.shutdown();
        return 0;
    }

    if (ingest->parsed()) {
        auto result = service.ingest(ingest_path);
        std::cout << ingest::outcomeToString(result.outcome);
        if (!result.checksum.empty())
            std::cout << " " << result.checksum;
        if (!result.message.empty())
            std::cout << " (" << result.message << ")";
        std::cout << std::endl;
        return result.outcome == ingest::IngestOutcome::Error ? 1 : 0;
    }

    if (asset->parsed()) {
        auto kind = assets::parseKind(asset_kind);
        if (!kind)
            return fail(kind.error());

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::minutes(2);
        while (true) {
            auto status = service.getOrBuildAsset(asset_checksum, kind.value(), asset_size);
            if (!status)
                return fail(status.error());
            if (status.value().ready()) {
                std::cout << status.value().path.string() << std::endl;
                return 0;
            }
            if (!asset_wait) {
                std::cout << "pending" << std::endl;
                return 0;
            }
            if (std::chrono::steady_clock::now() > deadline) {
                return fail(Error{ErrorCode::Timeout, "Asset build did not finish"});
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    if (purge->parsed()) {
        auto kind = assets::parseKind(purge_kind);
        if (!kind)
            return fail(kind.error());
        auto removed = service.purgeAssets(kind.value());
        if (!removed)
            return fail(removed.error());
        std::cout << "Removed " << removed.value() << " files" << std::endl;
        return 0;
    }

    if (reprocess->parsed()) {
        ingest::ReprocessScope scope = ingest::AllLocations{};
        if (reprocess_location)
            scope = *reprocess_location;
        else if (!reprocess_dir.empty())
            scope = reprocess_dir;
        auto result = service.reprocessMetadata(scope);
        if (!result)
            return fail(result.error());
        const auto& s = result.value();
        std::cout << "Processed " << s.processed << ", updated " << s.updated << ", missing "
                  << s.missing << ", kept " << s.kept << std::endl;
        return 0;
    }

    if (rebuild->parsed()) {
        auto rows = service.rebuildSearchIndex();
        if (!rows)
            return fail(rows.error());
        std::cout << "Indexed " << rows.value() << " locations" << std::endl;
        return 0;
    }

    if (vacuum->parsed()) {
        if (auto result = service.vacuum(); !result)
            return fail(result.error());
        return 0;
    }

    if (roots->parsed()) {
        Result<void> result;
        if (rootsList->parsed()) {
            auto list = service.listRoots();
            if (!list)
                return fail(list.error());
            for (const auto& root : list.value()) {
                std::cout << root.path << "\t" << catalog::tierToString(root.tier)
                          << (root.ignored ? "\tignored" : "");
                for (const auto& t : root.tags)
                    std::cout << "\t#" << t;
                std::cout << std::endl;
            }
            return 0;
        } else if (rootsAdd->parsed()) {
            auto tier = catalog::parseTier(root_tier);
            if (!tier)
                return fail(tier.error());
            result = service.addRoot(root_path, tier.value());
        } else if (rootsRemove->parsed()) {
            result = service.removeRoot(root_path);
        } else if (rootsIgnore->parsed()) {
            result = service.setRootIgnored(root_path, !unignore);
        } else if (rootsTag->parsed()) {
            result = service.tagRoot(root_path, root_tag);
        }
        if (!result)
            return fail(result.error());
        return 0;
    }

    if (tag->parsed()) {
        if (auto result = service.tagContent(tag_checksum, tag_name); !result)
            return fail(result.error());
        return 0;
    }

    if (trash->parsed()) {
        if (auto result = service.setTrashed(location_id, !restore); !result)
            return fail(result.error());
        return 0;
    }

    if (del->parsed()) {
        auto result = service.permanentDelete(location_id);
        if (!result)
            return fail(result.error());
        std::cout << "Deleted location " << location_id
                  << (result.value().contentRemoved ? " and its content" : "") << std::endl;
        return 0;
    }

    if (stats->parsed()) {
        auto result = service.stats();
        if (!result)
            return fail(result.error());
        const auto& s = result.value();
        std::cout << "contents:  " << s.contents << "\n"
                  << "locations: " << s.locations << "\n"
                  << "trashed:   " << s.trashed << "\n"
                  << "indexed:   " << s.indexedRows << "\n"
                  << "roots:     " << s.roots << std::endl;
        return 0;
    }

    return 0;
}
