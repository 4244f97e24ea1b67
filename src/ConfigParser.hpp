#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "CategoryTable.hpp"

#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Parses the optional JSON configuration and exposes the downloads folder and category table.
class ConfigParser {
public:
    // `homeFolder` backs the built-in {{home}} placeholder.
    explicit ConfigParser(std::string homeFolder = {});

    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::string& filePath);
    // Same as load() for an in-memory document.
    bool loadFromString(const std::string& document);

    // Configured downloads folder with placeholders applied, or empty when not set.
    const std::string& getDownloadsFolder() const;
    const std::vector<Category>& getCategories() const;
    const std::string& getFallbackCategory() const;
    // Category table built from the loaded (or default) settings.
    CategoryTable makeTable() const;

private:
    bool parse(const nlohmann::json& data, const std::string& source);
    // Collect placeholder tokens (built-in and user-defined) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Replace placeholder tokens in strings, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    // Parse and validate a JSON array of category objects, merging into m_categories.
    bool parseCategoryArray(const nlohmann::json& categoriesArray);

    std::string m_homeFolder;
    std::string m_downloads_folder;
    std::string m_fallback_category = CategoryTable::kDefaultFallback;
    std::vector<Category> m_categories = CategoryTable::builtInCategories();
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
