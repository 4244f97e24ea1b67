#include "ConfigParser.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

ConfigParser::ConfigParser(std::string homeFolder) : m_homeFolder(std::move(homeFolder)) {}

const std::string& ConfigParser::getDownloadsFolder() const {
    return m_downloads_folder;
}

const std::vector<Category>& ConfigParser::getCategories() const {
    return m_categories;
}

const std::string& ConfigParser::getFallbackCategory() const {
    return m_fallback_category;
}

CategoryTable ConfigParser::makeTable() const {
    return CategoryTable(m_categories, m_fallback_category);
}

bool ConfigParser::load(const std::string& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << filePath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    return parse(data, filePath);
}

bool ConfigParser::loadFromString(const std::string& document) {
    json data;
    try {
        data = json::parse(document);
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration: " << e.what() << std::endl;
        return false;
    }

    return parse(data, "<inline>");
}

bool ConfigParser::parse(const json& data, const std::string& source) {
    if (!data.is_object()) {
        std::cerr << "Invalid configuration: top level must be an object." << std::endl;
        return false;
    }

    loadPlaceholders(data);

    // Work on copies so a rejected file leaves the previous settings untouched.
    const std::string previousFolder = m_downloads_folder;
    const std::string previousFallback = m_fallback_category;
    const std::vector<Category> previousCategories = m_categories;
    auto restore = [&]() {
        m_downloads_folder = previousFolder;
        m_fallback_category = previousFallback;
        m_categories = previousCategories;
        return false;
    };

    if (auto it = data.find("downloads_folder"); it != data.end()) {
        if (!it->is_string()) {
            std::cerr << "`downloads_folder` must be a string." << std::endl;
            return restore();
        }
        m_downloads_folder = applyPlaceholders(it->get<std::string>());
    }

    if (auto it = data.find("fallback_category"); it != data.end()) {
        if (!it->is_string() || !CategoryTable::isValidName(it->get<std::string>())) {
            std::cerr << "`fallback_category` must be a plain folder name." << std::endl;
            return restore();
        }
        m_fallback_category = it->get<std::string>();
    }

    bool useDefaultCategories = true;
    if (auto it = data.find("use_default_categories"); it != data.end()) {
        if (!it->is_boolean()) {
            std::cerr << "`use_default_categories` must be a boolean value." << std::endl;
            return restore();
        }
        useDefaultCategories = it->get<bool>();
    }

    if (useDefaultCategories) {
        m_categories = CategoryTable::builtInCategories();
        // The built-in catch-all takes the configured name.
        for (auto& category : m_categories) {
            if (category.name == CategoryTable::kDefaultFallback && category.extensions.empty()) {
                category.name = m_fallback_category;
            }
        }
    } else {
        m_categories.clear();
    }

    for (const auto& category : m_categories) {
        if (category.name == m_fallback_category && !category.extensions.empty()) {
            std::cerr << "`fallback_category` cannot reuse the existing category `" << category.name << "`."
                      << std::endl;
            return restore();
        }
    }

    if (auto it = data.find("categories"); it != data.end()) {
        try {
            if (!parseCategoryArray(*it)) {
                return restore();
            }
        } catch (const json::exception& e) {
            std::cerr << "Invalid categories configuration: " << e.what() << std::endl;
            return restore();
        }
    } else if (!useDefaultCategories) {
        std::cerr << "No categories configured. Enable `use_default_categories` or add entries to `categories`."
                  << std::endl;
        return restore();
    }

    const bool anyExtension = std::any_of(m_categories.begin(), m_categories.end(), [](const Category& category) {
        return !category.extensions.empty();
    });
    if (!anyExtension) {
        std::cerr << "Configuration does not map any extension to a category." << std::endl;
        return restore();
    }

    std::cout << "Loaded " << m_categories.size() << " categor" << (m_categories.size() == 1 ? "y" : "ies")
              << " from " << source << std::endl;
    return true;
}

bool ConfigParser::parseCategoryArray(const json& categoriesArray) {
    if (!categoriesArray.is_array()) {
        std::cerr << "Invalid configuration: `categories` must be an array." << std::endl;
        return false;
    }

    for (const auto& categoryJson : categoriesArray) {
        if (!categoryJson.is_object()) {
            std::cerr << "Invalid category entry: expected an object." << std::endl;
            return false;
        }

        auto nameIt = categoryJson.find("name");
        if (nameIt == categoryJson.end() || !nameIt->is_string() || nameIt->get<std::string>().empty()) {
            std::cerr << "Invalid category: missing or invalid `name`." << std::endl;
            return false;
        }
        const std::string name = nameIt->get<std::string>();
        if (!CategoryTable::isValidName(name)) {
            std::cerr << "Invalid category `" << name << "`: the name must be a plain folder name." << std::endl;
            return false;
        }

        std::vector<std::string> extensions;
        if (auto extensionsIt = categoryJson.find("extensions"); extensionsIt != categoryJson.end()) {
            if (!extensionsIt->is_array()) {
                std::cerr << "Invalid category `" << name << "`: `extensions` must be an array." << std::endl;
                return false;
            }

            for (const auto& ext : *extensionsIt) {
                if (!ext.is_string()) {
                    std::cerr << "Invalid category `" << name << "`: each extension must be a string." << std::endl;
                    return false;
                }
                extensions.push_back(ext.get<std::string>());
            }
        }

        if (name == m_fallback_category && !extensions.empty()) {
            std::cerr << "Invalid category `" << name << "`: the fallback category cannot list extensions."
                      << std::endl;
            return false;
        }

        auto existing = std::find_if(m_categories.begin(), m_categories.end(), [&name](const Category& category) {
            return category.name == name;
        });
        if (existing != m_categories.end()) {
            existing->extensions.insert(existing->extensions.end(), extensions.begin(), extensions.end());
        } else {
            m_categories.push_back({name, std::move(extensions)});
        }
    }

    return true;
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();
    if (!m_homeFolder.empty()) {
        m_placeholders["home"] = m_homeFolder;
    }

    auto addPlaceholder = [this](const std::string& key, const json& value) {
        if (!value.is_string()) {
            std::cerr << "Placeholder `" << key << "` must be a string." << std::endl;
            return;
        }
        m_placeholders[key] = value.get<std::string>();
    };

    if (auto placeholdersIt = data.find("placeholders"); placeholdersIt != data.end()) {
        if (!placeholdersIt->is_object()) {
            std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        } else {
            for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
                addPlaceholder(it.key(), it.value());
            }
        }
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        std::cerr << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
