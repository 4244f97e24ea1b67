#ifndef ORGANIZER_EVENTS_HPP
#define ORGANIZER_EVENTS_HPP

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <system_error>

enum class EventKind {
    FolderCreated,
    FolderCreationFailed,
    RootNotFound,
    ScanFailed,
    FileMoved,
    FileWouldMove,
    FileSkipped,
    RunSummary
};

// One structured notification from the organizer. Fields not relevant to the kind stay empty.
struct OrganizerEvent {
    EventKind kind = EventKind::RunSummary;
    std::string category;
    std::filesystem::path source;
    std::filesystem::path destination;
    std::error_code error;
    std::size_t moved = 0;
    std::size_t skipped = 0;
};

// Receives everything the organizer reports while it runs.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const OrganizerEvent& event) = 0;
};

// Writes events as timestamped lines; errors go to the error stream.
class ConsoleEventSink : public EventSink {
public:
    ConsoleEventSink();
    ConsoleEventSink(std::ostream& out, std::ostream& err, bool timestamps = true);

    void onEvent(const OrganizerEvent& event) override;

    // Human-readable message for the event, without timestamp or level.
    static std::string describe(const OrganizerEvent& event);
    static bool isError(EventKind kind);

private:
    std::string timestamp() const;

    std::ostream& m_out;
    std::ostream& m_err;
    bool m_timestamps;
};

#endif
