#include <spdlog/spdlog.h>
#include <mediacat/config/config.h>
#include <mediacat/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace mediacat::config {

namespace {

// Position of the first '#' outside quotes, or npos
size_t findComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return i;
        }
    }
    return std::string::npos;
}

// '=' separating key from value; skips over a quoted key
size_t findAssignment(const std::string& line) {
    size_t start = 0;
    if (!line.empty() && (line[0] == '"' || line[0] == '\'')) {
        const size_t close = line.find(line[0], 1);
        if (close == std::string::npos)
            return std::string::npos;
        start = close + 1;
    }
    return line.find('=', start);
}

Result<int> parsePositiveInt(const FlatConfig& values, const std::string& key, int fallback) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty())
        return fallback;

    int value = 0;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Config value " + key + " must be a positive integer, got '" + text + "'"};
    }
    return value;
}

std::string valueOr(const FlatConfig& values, const std::string& key, std::string fallback) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty())
        return fallback;
    return it->second;
}

const char* envOrNull(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

FlatConfig parseTomlFlat(std::istream& in) {
    FlatConfig values;
    std::string line;
    std::string section;

    while (std::getline(in, line)) {
        if (auto comment = findComment(line); comment != std::string::npos)
            line.erase(comment);
        trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[') {
            if (line.back() == ']') {
                section = line.substr(1, line.size() - 2);
                trim(section);
            }
            continue;
        }

        const size_t eq = findAssignment(line);
        if (eq == std::string::npos)
            continue;

        std::string key = unquote(line.substr(0, eq));
        std::string value = unquote(line.substr(eq + 1));
        values[section.empty() ? key : section + "." + key] = value;
    }
    return values;
}

Result<MediacatConfig> buildConfig(const FlatConfig& values) {
    MediacatConfig config;

    config.core.dataDir = expand_tilde(valueOr(values, "core.data_dir", get_data_dir().string()));
    config.core.cacheDir =
        expand_tilde(valueOr(values, "core.cache_dir", get_cache_dir().string()));
    config.core.logLevel = valueOr(values, "core.log_level", "info");
    if (auto logFile = valueOr(values, "core.log_file", ""); !logFile.empty())
        config.core.logFile = expand_tilde(logFile);

    if (const char* env = envOrNull("MEDIACAT_DATA_DIR"))
        config.core.dataDir = expand_tilde(env);
    if (const char* env = envOrNull("MEDIACAT_CACHE_DIR"))
        config.core.cacheDir = expand_tilde(env);
    if (const char* env = envOrNull("MEDIACAT_LOG_LEVEL"))
        config.core.logLevel = env;

    struct IntField {
        const char* key;
        int* target;
    };
    int debounceMs = static_cast<int>(config.notify.debounce.count());
    int busyMs = static_cast<int>(config.database.busyTimeout.count());
    for (const IntField& field : {IntField{"assets.thumbnail_size", &config.assets.thumbnailSize},
                                  IntField{"assets.preview_size", &config.assets.previewSize},
                                  IntField{"assets.workers", &config.assets.workers},
                                  IntField{"assets.jpeg_quality", &config.assets.jpegQuality},
                                  IntField{"notify.debounce_ms", &debounceMs},
                                  IntField{"database.busy_timeout_ms", &busyMs},
                                  IntField{"database.max_connections",
                                           &config.database.maxConnections}}) {
        auto parsed = parsePositiveInt(values, field.key, *field.target);
        if (!parsed)
            return parsed.error();
        *field.target = parsed.value();
    }
    config.notify.debounce = std::chrono::milliseconds(debounceMs);
    config.database.busyTimeout = std::chrono::milliseconds(busyMs);
    if (config.assets.jpegQuality > 100) {
        return Error{ErrorCode::InvalidArgument, "assets.jpeg_quality must be at most 100"};
    }

    config.assets.ffmpeg = valueOr(values, "assets.ffmpeg", "ffmpeg");
    config.assets.ffprobe = valueOr(values, "assets.ffprobe", "ffprobe");

    static const std::string kRootsPrefix = "roots.";
    for (const auto& [key, value] : values) {
        if (key.rfind(kRootsPrefix, 0) != 0)
            continue;
        const std::filesystem::path rootPath = expand_tilde(key.substr(kRootsPrefix.size()));
        if (!rootPath.is_absolute()) {
            return Error{ErrorCode::InvalidArgument,
                         "Watched root must be an absolute path: " + rootPath.string()};
        }
        auto tier = catalog::parseTier(value);
        if (!tier)
            return tier.error();

        std::string normalized = rootPath.lexically_normal().string();
        if (normalized.size() > 1 && normalized.back() == '/')
            normalized.pop_back();
        config.roots.push_back({normalized, tier.value()});
    }
    return config;
}

Result<MediacatConfig> loadConfig(const std::string& overridePath) {
    std::string requested = overridePath;
    if (requested.empty()) {
        if (const char* env = envOrNull("MEDIACAT_CONFIG"))
            requested = env;
    }
    const std::filesystem::path path = get_config_path(requested);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!requested.empty())
            return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
        spdlog::debug("No config file at {}, using defaults", path.string());
        return buildConfig({});
    }

    std::ifstream file(path);
    if (!file)
        return Error{ErrorCode::IOError, "Cannot read config file: " + path.string()};

    spdlog::debug("Loading config from {}", path.string());
    return buildConfig(parseTomlFlat(file));
}

} // namespace mediacat::config
