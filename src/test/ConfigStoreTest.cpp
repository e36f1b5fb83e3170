#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigStore.hpp"
#include "FakeHostRuntime.hpp"

using namespace dialog;
using dialog::infrastructure::ConfigStore;
using dialog::infrastructure::PathResolver;
using dialog::test::FakeHostRuntime;
using json = nlohmann::json;

namespace {

const std::string kConfigFile = "/home/user/notes/.dialog/app.json";

struct Fixture {
    std::shared_ptr<FakeHostRuntime> host = std::make_shared<FakeHostRuntime>();
    std::shared_ptr<PathResolver> paths = std::make_shared<PathResolver>(host);
    ConfigStore config{host, paths};

    json written() const { return json::parse(*host->fileText(kConfigFile)); }
};

template <typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

static void testDefaultsCreated() {
    Fixture f;
    domain::AppConfig cfg = f.config.load();
    assert(cfg.theme == domain::Theme::Light);
    assert(!cfg.accentColor);
    assert(cfg.editor.fontSize == 16 && cfg.editor.lineHeight == 1.6 && cfg.editor.spellcheck);
    assert(cfg.autoSaveInterval == 1000);
    assert(cfg.ai.provider == domain::AiProvider::OpenAI);
    assert(cfg.ai.baseUrl == "https://api.openai.com/v1" && cfg.ai.apiKey.empty() && cfg.ai.model == "gpt-4o");

    assert(f.host->writeCount(kConfigFile) == 1);
    json j = f.written();
    assert(j["theme"] == "light" && j["ai"]["provider"] == "openai");
    assert(!j.contains("accentColor"));

    // Cached: no second read or write.
    f.config.load();
    assert(f.host->writeCount(kConfigFile) == 1);
    std::cout << "[PASS] Missing config file is created with defaults." << std::endl;
}

static void testMergesPartialFile() {
    Fixture f;
    f.host->putFile(kConfigFile, R"({"theme":"dark","editor":{"fontSize":20},"custom":{"keep":true}})");
    domain::AppConfig cfg = f.config.load();
    assert(cfg.theme == domain::Theme::Dark);
    assert(cfg.editor.fontSize == 20 && cfg.editor.lineHeight == 1.6);
    assert(cfg.ai.model == "gpt-4o");
    assert(f.host->writeCount(kConfigFile) == 0);

    // Unrelated keys in the file survive a write.
    f.config.setValue("autoSaveInterval", 500);
    json j = f.written();
    assert(j["autoSaveInterval"] == 500 && j["theme"] == "dark" && j["custom"]["keep"] == true);
    std::cout << "[PASS] Partial config merges over defaults." << std::endl;
}

static void testMalformedFileRestored() {
    Fixture f;
    f.host->putFile(kConfigFile, "theme = dark");
    domain::AppConfig cfg = f.config.load();
    assert(cfg.theme == domain::Theme::Light);
    assert(f.host->writeCount(kConfigFile) == 1);
    assert(f.written()["theme"] == "light");
    std::cout << "[PASS] Malformed config file is replaced by defaults." << std::endl;
}

static void testGetSetValue() {
    Fixture f;
    assert(f.config.getValue("theme") == "light");
    assert(f.config.getValue("accentColor").is_null());

    f.config.setValue("theme", "dark");
    assert(f.config.load().theme == domain::Theme::Dark);
    assert(f.written()["theme"] == "dark");

    f.config.setValue("accentColor", "#ff8800");
    assert(*f.config.load().accentColor == "#ff8800");
    f.config.setValue("accentColor", nullptr);
    assert(!f.config.load().accentColor);
    assert(!f.written().contains("accentColor"));

    f.config.setValue("ai", json{{"provider", "claude"}, {"model", "sonnet"}});
    auto ai = f.config.load().ai;
    assert(ai.provider == domain::AiProvider::Claude && ai.model == "sonnet");
    assert(ai.baseUrl == "https://api.openai.com/v1");
    std::cout << "[PASS] getValue()/setValue() read and patch single settings." << std::endl;
}

static void testRejectsInvalid() {
    Fixture f;
    f.config.load();
    const int writes = f.host->writeCount(kConfigFile);

    assert(Throws([&] { f.config.getValue("nope"); }));
    assert(Throws([&] { f.config.setValue("nope", 1); }));
    assert(Throws([&] { f.config.setValue("theme", "sepia"); }));
    assert(Throws([&] { f.config.setValue("autoSaveInterval", "soon"); }));
    assert(Throws([&] { f.config.setValue("ai", json{{"provider", "skynet"}}); }));
    assert(Throws([&] { f.config.setValue("accentColor", 5); }));
    assert(Throws([&] { f.config.setValue("accentColor", json{{"r", 255}}); }));

    assert(f.config.load().theme == domain::Theme::Light);
    assert(f.config.load().autoSaveInterval == 1000);
    assert(f.config.getValue("accentColor").is_null());
    assert(f.host->writeCount(kConfigFile) == writes);
    std::cout << "[PASS] Invalid keys and values are rejected without side effects." << std::endl;
}

static void testSaveAndReset() {
    Fixture f;
    domain::AppConfig cfg = f.config.load();
    cfg.theme = domain::Theme::Dark;
    cfg.accentColor = "#123456";
    cfg.editor.spellcheck = false;
    f.config.save(cfg);

    f.config.reset();
    domain::AppConfig reloaded = f.config.load();
    assert(reloaded.theme == domain::Theme::Dark);
    assert(*reloaded.accentColor == "#123456");
    assert(!reloaded.editor.spellcheck);
    assert(f.config.storageDir() == "/home/user/notes/.dialog");
    std::cout << "[PASS] save() persists and a reset reloads from disk." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ConfigStore Test..." << std::endl;
    testDefaultsCreated();
    testMergesPartialFile();
    testMalformedFileRestored();
    testGetSetValue();
    testRejectsInvalid();
    testSaveAndReset();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
