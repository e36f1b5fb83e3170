#include <algorithm>
#include <cctype>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>

#include "infrastructure/LocalHostRuntime.hpp"

using dialog::infrastructure::LocalHostRuntime;
namespace fs = std::filesystem;

static bool LooksLikeUuidV4(const std::string& id) {
    if (id.size() != 36) return false;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return id[14] == '4' && std::string("89ab").find(id[19]) != std::string::npos;
}

int main() {
    std::cout << "[Test] Starting LocalHostRuntime Test..." << std::endl;

    // Use a test-specific root to avoid cluttering real user data
    fs::path root = fs::temp_directory_path() / "dialog_host_runtime_test";
    fs::remove_all(root);

    LocalHostRuntime host;
    const std::string dir = (root / "content").string();
    const std::string file = (root / "content" / "a.json").string();

    // Missing files read as absent.
    assert(!host.readFile(file));
    assert(host.listFiles(dir).empty());

    // Writes create parent directories and replace content atomically.
    assert(host.writeFile(file, "{\"v\":1}"));
    assert(*host.readFile(file) == "{\"v\":1}");
    assert(host.writeFile(file, "{\"v\":2}"));
    assert(*host.readFile(file) == "{\"v\":2}");
    std::cout << "[PASS] writeFile() creates directories and overwrites." << std::endl;

    assert(host.writeFile((root / "content" / "b.json").string(), "{}"));
    fs::create_directories(root / "content" / "nested");
    auto names = host.listFiles(dir);
    std::sort(names.begin(), names.end());
    // Only regular files, and no temp files left behind.
    assert(names.size() == 2 && names[0] == "a.json" && names[1] == "b.json");
    std::cout << "[PASS] listFiles() returns regular file names only." << std::endl;

    assert(host.deleteFile(file));
    assert(!host.readFile(file));
    // Already gone: still a success.
    assert(host.deleteFile(file));
    assert(host.deleteFile((root / "never" / "written.json").string()));
    std::cout << "[PASS] deleteFile() removes, and treats a missing file as done." << std::endl;

    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        std::string id = host.newUniqueId();
        assert(LooksLikeUuidV4(id));
        ids.insert(id);
    }
    assert(ids.size() == 200);
    std::cout << "[PASS] newUniqueId() returns distinct v4 UUIDs." << std::endl;

    auto t1 = host.now();
    auto t2 = host.now();
    assert(t1 > 1600000000000LL && t2 >= t1);
    assert(!host.currentDirectory().empty());
    std::cout << "[PASS] now() and currentDirectory() report the environment." << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
