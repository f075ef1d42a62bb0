#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"
#include "infrastructure/RecordStore.hpp"

using namespace staffledger::infrastructure;
namespace fs = std::filesystem;

namespace {

std::size_t CountWithSuffix(const fs::path& dir, const std::string& needle) {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().find(needle) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

void WriteRaw(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RecordStore Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / ("staffledger_store_" + Credentials::NewId());
    RecordStore store(testRoot);
    assert(fs::is_directory(testRoot));

    // Missing collection reads as empty without creating anything.
    assert(store.read("employees").empty());
    assert(!fs::exists(store.collectionPath("employees")));

    // Write then read preserves order and values.
    RecordList rows = {
        {{"id", "a"}, {"hours", 1.5}, {"note", nullptr}},
        {{"id", "b"}, {"hours", 0}, {"tags", {"x", "y"}}},
    };
    store.write("employees", rows);
    RecordList back = store.read("employees");
    assert(back.size() == 2);
    assert(back[0] == rows[0]);
    assert(back[1] == rows[1]);
    assert(back[1]["tags"][1] == "y");
    assert(CountWithSuffix(testRoot, ".tmp") == 0);
    std::cout << "[PASS] Round trip" << std::endl;

    // Compact output when pretty printing is off.
    {
        RecordStore compact(testRoot / "compact", false);
        compact.write("settings", {{{"id", "system_settings"}}});
        std::ifstream in(compact.collectionPath("settings"));
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(text == R"([{"id":"system_settings"}])");
    }

    // Blank file is an empty collection, not corruption.
    WriteRaw(store.collectionPath("feedback"), "  \n");
    assert(store.read("feedback").empty());
    assert(CountWithSuffix(testRoot, "feedback.json.backup_") == 0);

    // Malformed JSON is quarantined and the collection becomes empty.
    WriteRaw(store.collectionPath("employees"), "[{\"id\": \"a\",");
    assert(store.read("employees").empty());
    assert(!fs::exists(store.collectionPath("employees")));
    assert(CountWithSuffix(testRoot, "employees.json.backup_") == 1);

    // Writes succeed against the emptied collection.
    store.write("employees", {{{"id", "c"}}});
    assert(store.read("employees").size() == 1);
    std::cout << "[PASS] Malformed collection quarantined" << std::endl;

    // Top-level object and non-object elements are corruption as well.
    WriteRaw(store.collectionPath("work_logs"), "{\"id\": \"a\"}");
    assert(store.read("work_logs").empty());
    assert(CountWithSuffix(testRoot, "work_logs.json.backup_") == 1);

    WriteRaw(store.collectionPath("leave_requests"), "[{\"id\": \"a\"}, 42]");
    assert(store.read("leave_requests").empty());
    assert(CountWithSuffix(testRoot, "leave_requests.json.backup_") == 1);
    std::cout << "[PASS] Non-array and non-object rows quarantined" << std::endl;

    // A failed rename leaves no temp file behind and keeps prior state.
    fs::create_directories(store.collectionPath("audit_trails") / "occupied");
    bool threw = false;
    try {
        store.write("audit_trails", {{{"id", "x"}}});
    } catch (const staffledger::domain::StorageWriteError&) {
        threw = true;
    }
    assert(threw);
    assert(CountWithSuffix(testRoot, ".tmp") == 0);
    assert(fs::is_directory(store.collectionPath("audit_trails") / "occupied"));

    // A data directory that cannot be created is a write failure too.
    WriteRaw(testRoot / "not_a_dir", "x");
    RecordStore blocked(testRoot / "not_a_dir" / "data");
    threw = false;
    try {
        blocked.write("employees", {{{"id", "x"}}});
    } catch (const staffledger::domain::StorageWriteError&) {
        threw = true;
    }
    assert(threw);
    assert(blocked.read("employees").empty());
    std::cout << "[PASS] Write failure surfaces StorageWriteError" << std::endl;

    // The exclusive section is released on scope exit.
    {
        auto lock = store.scopedExclusive("employees");
        assert(lock.ownsLock());
    }
    {
        auto again = store.scopedExclusive("employees");
        assert(again.ownsLock());
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] RecordStore Test Passed!" << std::endl;
    return 0;
}
