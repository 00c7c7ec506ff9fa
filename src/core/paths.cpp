#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

std::string GetRubricAssetsDir()
{
    if (const char* env = std::getenv("RUBRIC_ASSETS_DIR"); env && *env)
        return std::string(env);
    return "assets";
}

std::string RubricAssetPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    if (relative.empty())
        return GetRubricAssetsDir();
    return (fs::path(GetRubricAssetsDir()) / relative).string();
}
