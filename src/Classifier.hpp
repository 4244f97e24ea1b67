#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "CategoryTable.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

// Records an extension that a later category took over from an earlier one.
struct ExtensionReassignment {
    std::string extension;
    std::string previousCategory;
    std::string category;
};

// Maps extensions to category names. Read-only once constructed.
class Classifier {
public:
    explicit Classifier(const CategoryTable& table);

    // Category for a dotted extension (any case), or the fallback category when it is unknown.
    const std::string& classify(const std::string& extension) const;
    const std::string& classifyPath(const std::filesystem::path& file) const;

    const std::string& fallbackCategory() const;
    // Extensions listed under more than one category; the last listing wins.
    const std::vector<ExtensionReassignment>& reassignments() const;

    // Lower-cased suffix of the file name including the dot, or empty.
    static std::string extensionOf(const std::filesystem::path& file);

private:
    std::string m_fallbackCategory;
    std::unordered_map<std::string, std::string> m_extensionToCategory;
    std::vector<ExtensionReassignment> m_reassignments;
};

#endif
