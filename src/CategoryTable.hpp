#ifndef CATEGORY_TABLE_HPP
#define CATEGORY_TABLE_HPP

#include <string>
#include <vector>

// Category ties a destination folder name to the extensions that belong in it.
struct Category {
    std::string name;
    std::vector<std::string> extensions;
};

// Immutable, ordered set of categories plus the name of the catch-all bucket.
class CategoryTable {
public:
    static constexpr const char* kDefaultFallback = "Others";

    // Extensions are normalized, categories sharing a name are merged, entries whose name
    // is not a plain folder name are dropped and the fallback category is appended when missing.
    explicit CategoryTable(std::vector<Category> categories, std::string fallbackCategory = kDefaultFallback);

    // The reference policy shipped with the tool.
    static CategoryTable builtIn();
    static std::vector<Category> builtInCategories();

    const std::vector<Category>& categories() const;
    const std::string& fallbackCategory() const;
    bool contains(const std::string& name) const;

    // True for a single relative path component other than "." and "..".
    static bool isValidName(const std::string& name);

    // Trim whitespace, enforce the dot prefix and lower-case; empty input stays empty.
    static std::string normalizeExtension(std::string extension);

private:
    std::vector<Category> m_categories;
    std::string m_fallbackCategory;
};

#endif
