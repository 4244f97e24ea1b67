#include <catch2/catch.hpp>

#include "OrganizerEvents.hpp"

#include <sstream>

TEST_CASE("Console sink routes errors to the error stream") {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleEventSink sink(out, err, false);

    OrganizerEvent created;
    created.kind = EventKind::FolderCreated;
    created.category = "Images";
    sink.onEvent(created);

    OrganizerEvent failed;
    failed.kind = EventKind::FileSkipped;
    failed.source = "/downloads/photo.jpg";
    failed.error = std::make_error_code(std::errc::permission_denied);
    sink.onEvent(failed);

    CHECK(out.str() == "INFO - Created folder: Images\n");
    CHECK(err.str().rfind("ERROR - Error moving photo.jpg: ", 0) == 0);
}

TEST_CASE("Console sink prefixes a timestamp") {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleEventSink sink(out, err);

    OrganizerEvent summary;
    summary.moved = 3;
    summary.skipped = 1;
    sink.onEvent(summary);

    const std::string line = out.str();
    // YYYY-MM-DD HH:MM:SS - INFO - ...
    REQUIRE(line.size() > 22);
    CHECK(line[4] == '-');
    CHECK(line[13] == ':');
    CHECK(line.find(" - INFO - Organization complete. Moved: 3, Skipped: 1") == 19);
    CHECK(err.str().empty());
}

TEST_CASE("Event descriptions") {
    OrganizerEvent moved;
    moved.kind = EventKind::FileMoved;
    moved.category = "Documents";
    moved.source = "/dl/report.pdf";
    moved.destination = "/dl/Documents/report.pdf";
    CHECK(ConsoleEventSink::describe(moved) == "Moved: report.pdf -> Documents/");

    moved.destination = "/dl/Documents/report_1.pdf";
    CHECK(ConsoleEventSink::describe(moved) == "Moved: report.pdf -> Documents/ as report_1.pdf");

    moved.kind = EventKind::FileWouldMove;
    moved.destination = "/dl/Documents/report.pdf";
    CHECK(ConsoleEventSink::describe(moved) == "Would move: report.pdf -> Documents/");

    OrganizerEvent missing;
    missing.kind = EventKind::RootNotFound;
    missing.source = "/nowhere";
    CHECK(ConsoleEventSink::describe(missing) == "Downloads folder not found: /nowhere");
    CHECK(ConsoleEventSink::isError(EventKind::RootNotFound));
    CHECK_FALSE(ConsoleEventSink::isError(EventKind::FileWouldMove));
}
