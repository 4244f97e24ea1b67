#ifndef ORGANIZER_HPP
#define ORGANIZER_HPP

#include "CategoryTable.hpp"
#include "Classifier.hpp"
#include "OrganizerEvents.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

// One direct child of the root as seen during a scan.
struct FileEntry {
    std::filesystem::path path;
    std::string name;
    std::string extension;
    std::string parentName;
};

enum class MoveAction {
    Moved,
    WouldMove,
    SkippedAlreadyPlaced,
    Failed
};

// Outcome for a single scanned file.
struct MoveDecision {
    std::filesystem::path source;
    std::string category;
    std::filesystem::path destination;
    MoveAction action = MoveAction::Failed;
    std::error_code error;
};

enum class RunStatus {
    Completed,
    RootNotFound,
    FolderCreationFailed,
    ScanFailed
};

struct RunSummary {
    RunStatus status = RunStatus::Completed;
    std::error_code error;
    std::size_t moved = 0;
    std::size_t skipped = 0;
    std::vector<MoveDecision> decisions;

    bool ok() const { return status == RunStatus::Completed; }
};

struct CategoryListing {
    std::string category;
    std::vector<std::string> files;
};

struct Listing {
    RunStatus status = RunStatus::Completed;
    std::vector<CategoryListing> categories;
    std::size_t total = 0;
};

// Sorts the direct children of a root folder into per-category subfolders.
class Organizer {
public:
    Organizer(std::filesystem::path root, CategoryTable table, EventSink& sink);

    // Create any missing category folder under the root; returns the first failure.
    std::error_code ensureCategoryFolders();
    // Scan the root once. In simulate mode nothing on disk changes, moves are only reported.
    RunSummary organize(bool simulate);
    // Files currently sitting in each category folder, in table order.
    Listing listByCategory() const;

    const std::filesystem::path& root() const;
    const CategoryTable& table() const;
    const Classifier& classifier() const;

    // First free path for `fileName` inside `folder`, appending _1, _2, ... to the stem.
    // An existing entry that is the same file as `source` counts as free.
    static std::filesystem::path resolveCollision(const std::filesystem::path& folder,
                                                  const std::string& fileName,
                                                  const std::filesystem::path& source,
                                                  std::error_code& ec);

private:
    bool rootIsDirectory() const;
    FileEntry makeEntry(const std::filesystem::path& file) const;
    MoveDecision processEntry(const FileEntry& entry, bool simulate);
    // Rename, falling back to copy + remove across devices. Never overwrites.
    static std::error_code moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath);
    void emit(EventKind kind, const MoveDecision& decision);
    // Final counts; also sent when the run stops after the root check.
    void emitSummary(const RunSummary& summary);

    std::filesystem::path m_root;
    CategoryTable m_table;
    Classifier m_classifier;
    EventSink& m_sink;
};

#endif
