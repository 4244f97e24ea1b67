#include "OrganizerEvents.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

ConsoleEventSink::ConsoleEventSink() : ConsoleEventSink(std::cout, std::cerr) {}

ConsoleEventSink::ConsoleEventSink(std::ostream& out, std::ostream& err, bool timestamps)
    : m_out(out), m_err(err), m_timestamps(timestamps) {}

void ConsoleEventSink::onEvent(const OrganizerEvent& event) {
    const bool error = isError(event.kind);
    std::ostream& stream = error ? m_err : m_out;
    if (m_timestamps) {
        stream << timestamp() << " - ";
    }
    stream << (error ? "ERROR" : "INFO") << " - " << describe(event) << std::endl;
}

std::string ConsoleEventSink::describe(const OrganizerEvent& event) {
    const std::string fileName = event.source.filename().string();
    std::ostringstream message;

    switch (event.kind) {
    case EventKind::FolderCreated:
        message << "Created folder: " << event.category;
        break;
    case EventKind::FolderCreationFailed:
        message << "Failed to create folder " << event.category << ": " << event.error.message();
        break;
    case EventKind::RootNotFound:
        message << "Downloads folder not found: " << event.source.string();
        break;
    case EventKind::ScanFailed:
        message << "Unable to enumerate " << event.source.string() << ": " << event.error.message();
        break;
    case EventKind::FileMoved:
        message << "Moved: " << fileName << " -> " << event.category << "/";
        if (event.destination.filename() != event.source.filename()) {
            message << " as " << event.destination.filename().string();
        }
        break;
    case EventKind::FileWouldMove:
        message << "Would move: " << fileName << " -> " << event.category << "/";
        if (event.destination.filename() != event.source.filename()) {
            message << " as " << event.destination.filename().string();
        }
        break;
    case EventKind::FileSkipped:
        message << "Error moving " << fileName << ": " << event.error.message();
        break;
    case EventKind::RunSummary:
        message << "Organization complete. Moved: " << event.moved << ", Skipped: " << event.skipped;
        break;
    }

    return message.str();
}

bool ConsoleEventSink::isError(EventKind kind) {
    return kind == EventKind::FolderCreationFailed || kind == EventKind::RootNotFound ||
           kind == EventKind::ScanFailed ||
           kind == EventKind::FileSkipped;
}

std::string ConsoleEventSink::timestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};

#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::ostringstream stream;
    stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}
