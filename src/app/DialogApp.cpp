/**
 * @file DialogApp.cpp
 * @brief Implementation of the DialogApp class.
 */
#include "app/DialogApp.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/LocalHostRuntime.hpp"

namespace dialog::app {

namespace {

void PrintRecords(const std::vector<domain::NoteRecord>& records) {
    for (const auto& r : records) {
        std::cout << r.id << '\t' << r.title << '\t'
                  << (r.isDeleted ? r.deletedAt.value_or(r.updatedAt) : r.updatedAt)
                  << (r.isFavorite ? "\t*" : "") << '\n';
    }
}

bool RequireArgs(const std::vector<std::string>& args, std::size_t count) {
    if (args.size() < count) {
        std::cerr << "Missing argument for '" << args[0] << "'" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int DialogApp::Run(const std::vector<std::string>& args) {
    if (args.empty()) {
        return PrintUsage();
    }
    if (!Init()) {
        return 1;
    }

    int code = 1;
    try {
        code = Dispatch(args);
    } catch (const std::exception& e) {
        std::cerr << "[DialogApp] " << e.what() << std::endl;
        code = 1;
    }

    Shutdown();
    return code;
}

bool DialogApp::Init() {
    try {
        m_storage = std::make_unique<application::StorageContext>(
            std::make_shared<infrastructure::LocalHostRuntime>());
        m_storage->open();
    } catch (const std::exception& e) {
        std::cerr << "[DialogApp] Failed to open storage: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void DialogApp::Shutdown() {
    if (m_storage) {
        m_storage->shutdown();
        m_storage.reset();
    }
}

int DialogApp::Dispatch(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    auto& records = m_storage->records();

    auto requireKnown = [&](const std::string& id) {
        if (!records.load(id)) {
            std::cerr << "Unknown note: " << id << std::endl;
            return false;
        }
        return true;
    };

    if (cmd == "list") {
        PrintRecords(records.listActive());
    } else if (cmd == "favorites") {
        PrintRecords(records.listFavorites());
    } else if (cmd == "trash") {
        PrintRecords(records.listTrash());
    } else if (cmd == "search") {
        if (!RequireArgs(args, 2)) return 1;
        PrintRecords(records.search(args[1]));
    } else if (cmd == "new") {
        std::cout << records.create(args.size() > 1 ? args[1] : domain::kUntitled) << '\n';
    } else if (cmd == "show") {
        if (!RequireArgs(args, 2)) return 1;
        domain::NoteRecord record = m_storage->openRecord(args[1]);
        std::cout << infrastructure::toFileText(nlohmann::json(record)) << '\n';
    } else if (cmd == "save") {
        if (!RequireArgs(args, 3)) return 1;
        nlohmann::json content = nlohmann::json::parse(args[2]);
        std::optional<std::string> title;
        if (args.size() > 3) title = args[3];
        records.save(args[1], content, title);
    } else if (cmd == "rename") {
        if (!RequireArgs(args, 3)) return 1;
        auto existing = records.load(args[1]);
        if (!existing) {
            std::cerr << "Unknown note: " << args[1] << std::endl;
            return 1;
        }
        records.save(args[1], existing->content, args[2]);
    } else if (cmd == "fav") {
        if (!RequireArgs(args, 2) || !requireKnown(args[1])) return 1;
        records.toggleFavorite(args[1]);
    } else if (cmd == "rm") {
        if (!RequireArgs(args, 2) || !requireKnown(args[1])) return 1;
        records.moveToTrash(args[1]);
    } else if (cmd == "restore") {
        if (!RequireArgs(args, 2) || !requireKnown(args[1])) return 1;
        records.restoreFromTrash(args[1]);
    } else if (cmd == "purge") {
        if (!RequireArgs(args, 2)) return 1;
        records.permanentlyDelete(args[1]);
    } else if (cmd == "recent") {
        for (const auto& id : m_storage->workspace().snapshot().recentIds) {
            std::cout << id << '\n';
        }
    } else if (cmd == "config") {
        if (!RequireArgs(args, 3)) return 1;
        auto& config = m_storage->config();
        if (args[1] == "get") {
            std::cout << config.getValue(args[2]).dump(infrastructure::kJsonIndent) << '\n';
        } else if (args[1] == "set" && RequireArgs(args, 4)) {
            config.setValue(args[2], nlohmann::json::parse(args[3]));
        } else {
            return PrintUsage();
        }
    } else if (cmd == "paths") {
        const auto paths = m_storage->paths().resolve();
        std::cout << "storage\t" << paths.storageDir << '\n'
                  << "records\t" << paths.recordDir << '\n'
                  << "workspace\t" << paths.metadataFile << '\n'
                  << "config\t" << paths.configFile << '\n'
                  << "assets\t" << paths.assetDir << '\n';
    } else {
        return PrintUsage();
    }
    return 0;
}

int DialogApp::PrintUsage() const {
    std::cerr << "usage: dialog <command> [args]\n"
                 "  list | favorites | trash | recent | paths\n"
                 "  new [title]            create a note, prints its id\n"
                 "  show <id>              print a note and make it active\n"
                 "  save <id> <json> [title]\n"
                 "  rename <id> <title>\n"
                 "  fav <id> | rm <id> | restore <id> | purge <id>\n"
                 "  search <query>\n"
                 "  config get <key> | config set <key> <json>\n";
    return 1;
}

} // namespace dialog::app
