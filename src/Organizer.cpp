#include "Organizer.hpp"

#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

Organizer::Organizer(fs::path root, CategoryTable table, EventSink& sink)
    : m_root(std::move(root)), m_table(std::move(table)), m_classifier(m_table), m_sink(sink) {}

const fs::path& Organizer::root() const {
    return m_root;
}

const CategoryTable& Organizer::table() const {
    return m_table;
}

const Classifier& Organizer::classifier() const {
    return m_classifier;
}

std::error_code Organizer::ensureCategoryFolders() {
    for (const auto& category : m_table.categories()) {
        const fs::path folder = m_root / category.name;

        std::error_code ec;
        const bool created = fs::create_directory(folder, ec);
        if (!ec && !created && !fs::is_directory(folder, ec) && !ec) {
            // Something that is not a folder already holds the category name.
            ec = std::make_error_code(std::errc::not_a_directory);
        }

        if (ec) {
            OrganizerEvent event;
            event.kind = EventKind::FolderCreationFailed;
            event.category = category.name;
            event.destination = folder;
            event.error = ec;
            m_sink.onEvent(event);
            return ec;
        }

        if (created) {
            OrganizerEvent event;
            event.kind = EventKind::FolderCreated;
            event.category = category.name;
            event.destination = folder;
            m_sink.onEvent(event);
        }
    }

    return {};
}

RunSummary Organizer::organize(bool simulate) {
    RunSummary summary;

    if (!rootIsDirectory()) {
        OrganizerEvent event;
        event.kind = EventKind::RootNotFound;
        event.source = m_root;
        m_sink.onEvent(event);
        summary.status = RunStatus::RootNotFound;
        summary.error = std::make_error_code(std::errc::no_such_file_or_directory);
        return summary;
    }

    // A dry run must not touch the disk, so folders are only created for real runs.
    if (!simulate) {
        if (auto ec = ensureCategoryFolders()) {
            summary.status = RunStatus::FolderCreationFailed;
            summary.error = ec;
            emitSummary(summary);
            return summary;
        }
    }

    std::error_code ec;
    fs::directory_iterator iter(m_root, ec);
    if (ec) {
        OrganizerEvent event;
        event.kind = EventKind::ScanFailed;
        event.source = m_root;
        event.error = ec;
        m_sink.onEvent(event);
        summary.status = RunStatus::ScanFailed;
        summary.error = ec;
        emitSummary(summary);
        return summary;
    }

    // Snapshot the children first; moving while iterating would change the listing under us.
    std::vector<fs::path> files;
    for (fs::directory_iterator end; iter != end; iter.increment(ec)) {
        if (ec) {
            break;
        }

        const auto& entry = *iter;
        if (entry.path().filename().string().rfind('.', 0) == 0) {
            continue;
        }

        std::error_code typeErr;
        const bool isDirectory = entry.is_directory(typeErr);
        bool isRegular = false;
        if (!typeErr && !isDirectory) {
            isRegular = entry.is_regular_file(typeErr);
        }

        if (typeErr) {
            MoveDecision failed;
            failed.source = entry.path();
            failed.action = MoveAction::Failed;
            failed.error = typeErr;
            ++summary.skipped;
            emit(EventKind::FileSkipped, failed);
            summary.decisions.push_back(std::move(failed));
            continue;
        }

        if (isRegular) {
            files.push_back(entry.path());
        }
    }

    if (ec) {
        MoveDecision failed;
        failed.source = m_root;
        failed.action = MoveAction::Failed;
        failed.error = ec;
        ++summary.skipped;
        emit(EventKind::FileSkipped, failed);
        summary.decisions.push_back(std::move(failed));
    }

    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        MoveDecision decision = processEntry(makeEntry(file), simulate);
        if (decision.action == MoveAction::Moved) {
            ++summary.moved;
        } else if (decision.action == MoveAction::Failed) {
            ++summary.skipped;
        }
        summary.decisions.push_back(std::move(decision));
    }

    emitSummary(summary);
    return summary;
}

Listing Organizer::listByCategory() const {
    Listing listing;

    if (!rootIsDirectory()) {
        OrganizerEvent event;
        event.kind = EventKind::RootNotFound;
        event.source = m_root;
        m_sink.onEvent(event);
        listing.status = RunStatus::RootNotFound;
        return listing;
    }

    for (const auto& category : m_table.categories()) {
        CategoryListing entry;
        entry.category = category.name;

        const fs::path folder = m_root / category.name;
        std::error_code ec;
        if (fs::is_directory(folder, ec)) {
            fs::directory_iterator iter(folder, ec);
            for (fs::directory_iterator end; !ec && iter != end; iter.increment(ec)) {
                std::error_code typeErr;
                if (iter->is_regular_file(typeErr) && !typeErr) {
                    entry.files.push_back(iter->path().filename().string());
                }
            }
        }

        std::sort(entry.files.begin(), entry.files.end());
        listing.total += entry.files.size();
        listing.categories.push_back(std::move(entry));
    }

    return listing;
}

fs::path Organizer::resolveCollision(const fs::path& folder, const std::string& fileName, const fs::path& source,
                                     std::error_code& ec) {
    ec.clear();
    const fs::path name(fileName);
    const std::string stem = name.stem().string();
    const std::string extension = name.extension().string();

    fs::path candidate = folder / name;
    for (std::size_t counter = 1;; ++counter) {
        const bool taken = fs::exists(candidate, ec);
        if (ec) {
            return {};
        }

        if (!taken) {
            return candidate;
        }

        std::error_code sameErr;
        if (fs::equivalent(candidate, source, sameErr) && !sameErr) {
            return candidate;
        }

        candidate = folder / (stem + "_" + std::to_string(counter) + extension);
    }
}

bool Organizer::rootIsDirectory() const {
    std::error_code ec;
    return fs::is_directory(m_root, ec) && !ec;
}

FileEntry Organizer::makeEntry(const fs::path& file) const {
    FileEntry entry;
    entry.path = file;
    entry.name = file.filename().string();
    entry.extension = Classifier::extensionOf(file);
    entry.parentName = file.parent_path().filename().string();
    return entry;
}

MoveDecision Organizer::processEntry(const FileEntry& entry, bool simulate) {
    MoveDecision decision;
    decision.source = entry.path;
    decision.category = m_classifier.classify(entry.extension);

    if (entry.parentName == decision.category) {
        decision.action = MoveAction::SkippedAlreadyPlaced;
        decision.destination = entry.path;
        return decision;
    }

    std::error_code ec;
    decision.destination = resolveCollision(m_root / decision.category, entry.name, entry.path, ec);
    if (ec) {
        decision.action = MoveAction::Failed;
        decision.error = ec;
        emit(EventKind::FileSkipped, decision);
        return decision;
    }

    std::error_code sameErr;
    if (fs::equivalent(decision.destination, entry.path, sameErr) && !sameErr) {
        decision.action = MoveAction::SkippedAlreadyPlaced;
        return decision;
    }

    if (simulate) {
        decision.action = MoveAction::WouldMove;
        emit(EventKind::FileWouldMove, decision);
        return decision;
    }

    decision.error = moveFile(entry.path, decision.destination);
    if (decision.error) {
        decision.action = MoveAction::Failed;
        emit(EventKind::FileSkipped, decision);
        return decision;
    }

    decision.action = MoveAction::Moved;
    emit(EventKind::FileMoved, decision);
    return decision;
}

std::error_code Organizer::moveFile(const fs::path& sourcePath, const fs::path& targetPath) {
    // The collision check already ran; a target that shows up since then is a lost race.
    std::error_code ec;
    if (fs::exists(targetPath, ec) || ec) {
        return ec ? ec : std::make_error_code(std::errc::file_exists);
    }

    fs::rename(sourcePath, targetPath, ec);
    if (!ec) {
        return {};
    }

    if (ec != std::errc::cross_device_link) {
        return ec;
    }

    std::error_code copyErr;
    fs::copy_file(sourcePath, targetPath, fs::copy_options::none, copyErr);
    if (copyErr) {
        return copyErr;
    }

    std::error_code removeErr;
    fs::remove(sourcePath, removeErr);
    if (removeErr) {
        // Leave the original in place rather than keeping two copies around.
        std::error_code cleanupErr;
        fs::remove(targetPath, cleanupErr);
        return removeErr;
    }

    return {};
}

void Organizer::emit(EventKind kind, const MoveDecision& decision) {
    OrganizerEvent event;
    event.kind = kind;
    event.category = decision.category;
    event.source = decision.source;
    event.destination = decision.destination;
    event.error = decision.error;
    m_sink.onEvent(event);
}

void Organizer::emitSummary(const RunSummary& summary) {
    OrganizerEvent done;
    done.kind = EventKind::RunSummary;
    done.source = m_root;
    done.moved = summary.moved;
    done.skipped = summary.skipped;
    m_sink.onEvent(done);
}
