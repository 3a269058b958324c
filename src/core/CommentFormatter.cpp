#include "core/CommentFormatter.hpp"
#include "core/TextUtils.hpp"
#include <map>

namespace hframe {

CommentStyle CommentFormatter::detect_from_extension(const std::filesystem::path& filepath) {
    static const std::map<std::string, CommentStyle> styles = {
        // Python, Ruby, shell, config
        {".py", CommentStyle::HASH}, {".rb", CommentStyle::HASH},
        {".sh", CommentStyle::HASH}, {".bash", CommentStyle::HASH},
        {".yml", CommentStyle::HASH}, {".yaml", CommentStyle::HASH},
        {".toml", CommentStyle::HASH}, {".conf", CommentStyle::HASH},
        // C-style languages
        {".c", CommentStyle::SLASH}, {".cpp", CommentStyle::SLASH},
        {".h", CommentStyle::SLASH}, {".hpp", CommentStyle::SLASH},
        {".java", CommentStyle::SLASH}, {".js", CommentStyle::SLASH},
        {".ts", CommentStyle::SLASH}, {".jsx", CommentStyle::SLASH},
        {".tsx", CommentStyle::SLASH}, {".cs", CommentStyle::SLASH},
        {".go", CommentStyle::SLASH}, {".rs", CommentStyle::SLASH},
        {".swift", CommentStyle::SLASH}, {".kt", CommentStyle::SLASH},
        {".scala", CommentStyle::SLASH}, {".php", CommentStyle::SLASH},
        // Markup
        {".html", CommentStyle::HTML}, {".xml", CommentStyle::HTML},
        {".svg", CommentStyle::HTML},
        // Stylesheets
        {".css", CommentStyle::BLOCK}, {".scss", CommentStyle::BLOCK},
        {".sass", CommentStyle::BLOCK}, {".less", CommentStyle::BLOCK},
        {".sql", CommentStyle::SQL}
    };

    std::string ext = TextUtils::to_lower(filepath.extension().string());
    if (ext.empty()) {
        return CommentStyle::HASH;
    }

    auto it = styles.find(ext);
    return it != styles.end() ? it->second : CommentStyle::HASH;
}

std::string CommentFormatter::format(const std::filesystem::path& filepath, std::string_view comment) {
    std::string text(comment);

    switch (detect_from_extension(filepath)) {
        case CommentStyle::SLASH:
            return "// " + text;
        case CommentStyle::HTML:
            return "<!-- " + text + " -->";
        case CommentStyle::BLOCK:
            return "/* " + text + " */";
        case CommentStyle::SQL:
            return "-- " + text;
        case CommentStyle::HASH:
        default:
            return "# " + text;
    }
}

} // namespace hframe
