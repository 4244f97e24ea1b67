#include "Classifier.hpp"

#include <algorithm>
#include <cctype>

Classifier::Classifier(const CategoryTable& table) : m_fallbackCategory(table.fallbackCategory()) {
    for (const auto& category : table.categories()) {
        if (category.name == m_fallbackCategory) {
            continue;
        }

        for (const auto& ext : category.extensions) {
            auto [it, inserted] = m_extensionToCategory.emplace(ext, category.name);
            if (!inserted && it->second != category.name) {
                m_reassignments.push_back({ext, it->second, category.name});
                it->second = category.name;
            }
        }
    }
}

const std::string& Classifier::classify(const std::string& extension) const {
    // Callers pass the dotted form; only case is folded here.
    std::string lowered = extension;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    auto it = m_extensionToCategory.find(lowered);
    if (it == m_extensionToCategory.end()) {
        return m_fallbackCategory;
    }

    return it->second;
}

const std::string& Classifier::classifyPath(const std::filesystem::path& file) const {
    return classify(extensionOf(file));
}

const std::string& Classifier::fallbackCategory() const {
    return m_fallbackCategory;
}

const std::vector<ExtensionReassignment>& Classifier::reassignments() const {
    return m_reassignments;
}

std::string Classifier::extensionOf(const std::filesystem::path& file) {
    const auto name = file.filename();
    if (!name.has_extension()) {
        return {};
    }
    return CategoryTable::normalizeExtension(name.extension().string());
}
