#include <mediacat/catalog/catalog_types.h>

#include <algorithm>
#include <cctype>

namespace mediacat::catalog {

Result<VisibilityTier> parseTier(std::string_view value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "public") {
        return VisibilityTier::Public;
    }
    if (v == "restricted" || v == "admin" || v == "admin_only") {
        return VisibilityTier::Restricted;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown visibility tier: " + std::string(value)};
}

std::pair<std::string, std::string> splitPath(const std::filesystem::path& path) {
    auto normal = path.lexically_normal();
    return {normal.parent_path().string(), normal.filename().string()};
}

} // namespace mediacat::catalog
