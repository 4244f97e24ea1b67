#include "CategoryTable.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <utility>

CategoryTable::CategoryTable(std::vector<Category> categories, std::string fallbackCategory)
    : m_fallbackCategory(std::move(fallbackCategory)) {
    if (!isValidName(m_fallbackCategory)) {
        m_fallbackCategory = kDefaultFallback;
    }

    for (auto& category : categories) {
        if (!isValidName(category.name)) {
            continue;
        }

        auto existing = std::find_if(m_categories.begin(), m_categories.end(), [&category](const Category& other) {
            return other.name == category.name;
        });
        if (existing == m_categories.end()) {
            m_categories.push_back({category.name, {}});
            existing = std::prev(m_categories.end());
        }

        for (auto& ext : category.extensions) {
            std::string value = normalizeExtension(std::move(ext));
            if (value.empty() ||
                std::find(existing->extensions.begin(), existing->extensions.end(), value) != existing->extensions.end()) {
                continue;
            }
            existing->extensions.push_back(std::move(value));
        }
    }

    // The catch-all bucket always gets a folder, even when nobody listed it.
    if (!contains(m_fallbackCategory)) {
        m_categories.push_back({m_fallbackCategory, {}});
    }
}

CategoryTable CategoryTable::builtIn() {
    return CategoryTable(builtInCategories());
}

std::vector<Category> CategoryTable::builtInCategories() {
    // .xls/.xlsx and .ppt/.pptx appear twice; the later entry owns them.
    return {
        {"Documents", {".pdf", ".doc", ".docx", ".txt", ".rtf", ".odt", ".xls", ".xlsx", ".ppt", ".pptx"}},
        {"Images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".svg", ".webp", ".tiff", ".ico"}},
        {"Archives", {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2"}},
        {"Audio", {".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a"}},
        {"Video", {".mp4", ".avi", ".mkv", ".mov", ".wmv", ".flv", ".webm"}},
        {"Executables", {".exe", ".msi", ".dmg", ".pkg", ".deb", ".rpm"}},
        {"Code", {".py", ".js", ".html", ".css", ".java", ".cpp", ".c", ".php", ".rb", ".json", ".xml"}},
        {"Spreadsheets", {".csv", ".xls", ".xlsx", ".ods"}},
        {"Presentations", {".ppt", ".pptx", ".odp"}},
        {"Fonts", {".ttf", ".otf", ".woff", ".woff2"}},
        {"Torrents", {".torrent"}},
        {kDefaultFallback, {}}
    };
}

const std::vector<Category>& CategoryTable::categories() const {
    return m_categories;
}

const std::string& CategoryTable::fallbackCategory() const {
    return m_fallbackCategory;
}

bool CategoryTable::contains(const std::string& name) const {
    return std::any_of(m_categories.begin(), m_categories.end(), [&name](const Category& category) {
        return category.name == name;
    });
}

bool CategoryTable::isValidName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }

    const std::filesystem::path path(name);
    if (path.is_absolute() || path.has_root_path()) {
        return false;
    }

    return std::distance(path.begin(), path.end()) == 1 && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos;
}

std::string CategoryTable::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}
