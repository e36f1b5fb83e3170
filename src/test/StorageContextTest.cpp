#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "application/StorageContext.hpp"
#include "FakeHostRuntime.hpp"

using namespace dialog;
using dialog::application::StorageContext;
using dialog::application::StorageOptions;
using dialog::test::FakeHostRuntime;
using json = nlohmann::json;

namespace {

const std::string kStorageDir = "/home/user/notes/.dialog";
const std::string kMetadataFile = kStorageDir + "/workspace.json";
const std::string kConfigFile = kStorageDir + "/app.json";

StorageOptions SlowMetadata(bool flushOnShutdown = true) {
    StorageOptions options;
    options.metadataQuietPeriod = std::chrono::seconds(30);
    options.flushMetadataOnShutdown = flushOnShutdown;
    return options;
}

} // namespace

static void testOpenFreshDirectory() {
    auto host = std::make_shared<FakeHostRuntime>();
    StorageContext ctx(host, SlowMetadata());
    auto report = ctx.open();

    assert(report.recordsLoaded == 0);
    assert(!report.reconcile.report.changed());
    assert(ctx.paths().isResolved());
    assert(ctx.paths().resolve().storageDir == kStorageDir);
    assert(host->hasFile(kConfigFile));
    assert(!host->hasFile(kMetadataFile));
    assert(ctx.records().listActive().empty());
    std::cout << "[PASS] Opening an empty directory creates app.json only." << std::endl;
}

static void testRestartRepairsMetadata() {
    auto host = std::make_shared<FakeHostRuntime>();
    std::string a, b, c;
    {
        // Crash-like exit: metadata never reaches the disk.
        StorageContext first(host, SlowMetadata(false));
        first.open();
        a = first.records().create("Alpha");
        b = first.records().create("Beta");
        first.records().toggleFavorite(b);
        c = first.records().create("Gamma");
        first.records().moveToTrash(c);
        first.shutdown();
    }
    assert(!host->hasFile(kMetadataFile));

    StorageContext second(host, SlowMetadata());
    auto report = second.open();
    assert(report.recordsLoaded == 3);
    assert(report.reconcile.report.notesAdded == 2);
    assert(report.reconcile.report.favoritesAdded == 1);
    assert(report.reconcile.report.trashAdded == 1);
    assert(report.reconcile.report.wrote);
    assert(host->writeCount(kMetadataFile) == 1);

    auto active = second.records().listActive();
    assert(active.size() == 2 && active[0].id == b && active[1].id == a);
    assert(second.records().listFavorites().size() == 1);
    assert(second.records().listTrash().size() == 1 && second.records().listTrash()[0].id == c);

    auto ws = second.workspace().snapshot();
    assert(ws.notes.size() == 2 && ws.favorites.size() == 1 && ws.trash.size() == 1);
    std::cout << "[PASS] Restart rebuilds the cache and repairs workspace.json." << std::endl;
}

static void testShutdownFlushesMetadata() {
    auto host = std::make_shared<FakeHostRuntime>();
    StorageContext ctx(host, SlowMetadata());
    ctx.open();
    std::string id = ctx.records().create("Pending");
    assert(ctx.workspace().hasPendingWrite());
    assert(!host->hasFile(kMetadataFile));

    ctx.shutdown();
    ctx.shutdown();
    json ws = json::parse(*host->fileText(kMetadataFile));
    assert(ws["notes"].size() == 1 && ws["notes"][0]["id"] == id);
    assert(host->hasFile(kStorageDir + "/content/" + id + ".json"));
    assert(host->writeCount(kMetadataFile) == 1);
    std::cout << "[PASS] shutdown() flushes metadata and drains file writes." << std::endl;
}

static void testOpenRecordFallbacks() {
    auto host = std::make_shared<FakeHostRuntime>();
    StorageContext ctx(host, SlowMetadata());
    ctx.open();

    // 1. Cache.
    std::string cached = ctx.records().create("Cached");
    auto record = ctx.openRecord(cached);
    assert(record.title == "Cached");
    assert(*ctx.workspace().snapshot().activeRecordId == cached);

    // 2. Record file written behind the cache's back.
    host->putFile(kStorageDir + "/content/disk.json",
                  R"({"id":"disk","title":"From disk","content":{"blocks":[1,2]},"updatedAt":5,"isFavorite":false,"isDeleted":false})");
    record = ctx.openRecord("disk");
    assert(record.title == "From disk" && record.content["blocks"].size() == 2);
    assert(ctx.records().load("disk"));

    // 3. Nothing anywhere.
    record = ctx.openRecord("ghost");
    assert(record.id == "ghost" && record.title == "Untitled" && record.content.is_null());
    assert(!record.isDeleted && !record.isFavorite);
    assert(!ctx.records().load("ghost"));

    auto ws = ctx.workspace().snapshot();
    assert(*ws.activeRecordId == "ghost");
    assert(ws.recentIds.size() == 3 && ws.recentIds[0] == "ghost" && ws.recentIds[2] == cached);
    std::cout << "[PASS] openRecord() falls back from cache to file to an empty note." << std::endl;
}

static void testInvalidUtf8TitleStillPersists() {
    auto host = std::make_shared<FakeHostRuntime>();
    StorageContext ctx(host, SlowMetadata());
    ctx.open();

    // Latin-1 byte, as a non-UTF-8 terminal would pass it on the command line.
    std::string id = ctx.records().create("Caf\xe9");
    ctx.workspace().setActiveRecord(id);
    ctx.workspace().updateSidebar(true, 300);
    assert(ctx.workspace().persistNow());
    ctx.persistence().waitIdle();

    const std::string replaced = "Caf\xEF\xBF\xBD";
    auto recordText = host->fileText(kStorageDir + "/content/" + id + ".json");
    assert(recordText);
    assert(json::parse(*recordText)["title"] == replaced);
    assert(ctx.persistence().failureCount() == 0);

    json ws = json::parse(*host->fileText(kMetadataFile));
    assert(ws["notes"][0]["title"] == replaced);
    assert(ws["activeRecordId"] == id && ws["sidebar"]["width"] == 300);

    // Later metadata writes are not stuck behind the bad title.
    ctx.workspace().updateSidebar(false, std::nullopt);
    assert(ctx.workspace().persistNow());
    assert(host->writeCount(kMetadataFile) == 2);
    std::cout << "[PASS] Titles with invalid UTF-8 are written with replacement characters." << std::endl;
}

static void testFileNameIsRecordIdentity() {
    auto host = std::make_shared<FakeHostRuntime>();
    host->putFile(kStorageDir + "/content/renamed.json",
                  R"({"id":"stale","title":"Renamed","updatedAt":10,"isFavorite":false,"isDeleted":false})");
    StorageContext ctx(host, SlowMetadata());
    auto report = ctx.open();
    assert(report.recordsLoaded == 1);
    assert(ctx.records().load("renamed") && !ctx.records().load("stale"));
    assert(ctx.workspace().snapshot().notes[0].id == "renamed");

    host->putFile(kStorageDir + "/content/moved.json",
                  R"({"id":"other","title":"Moved","updatedAt":20,"isFavorite":false,"isDeleted":false})");
    auto record = ctx.openRecord("moved");
    assert(record.id == "moved" && record.title == "Moved");
    assert(ctx.records().load("moved") && !ctx.records().load("other"));
    std::cout << "[PASS] A record file's name decides its id." << std::endl;
}

static void testResetAndReopen() {
    auto host = std::make_shared<FakeHostRuntime>();
    StorageContext ctx(host, SlowMetadata());
    ctx.open();
    std::string id = ctx.records().create("Survivor");
    ctx.workspace().persistNow();

    ctx.reset();
    assert(ctx.records().size() == 0);
    assert(!ctx.paths().isResolved());

    auto report = ctx.open();
    assert(report.recordsLoaded == 1);
    assert(!report.reconcile.report.changed());
    assert(ctx.records().load(id)->title == "Survivor");
    assert(host->cwdCalls() == 2);
    std::cout << "[PASS] reset() drops cached state and open() rebuilds it." << std::endl;
}

int main() {
    std::cout << "[Test] Starting StorageContext Test..." << std::endl;
    testOpenFreshDirectory();
    testRestartRepairsMetadata();
    testShutdownFlushesMetadata();
    testOpenRecordFallbacks();
    testInvalidUtf8TitleStillPersists();
    testFileNameIsRecordIdentity();
    testResetAndReopen();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
