// =============================================================================
// TabFold — SettingsManager
// Config persistence and thread-safe snapshots.
//
// JSON load/save with per-key validation, atomic snapshot distribution,
// observer notification.
// =============================================================================

#include "tabfold/support/SettingsManager.h"

// nlohmann/json: header-only, located via CMake
#include <json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace TabFold
{

using json = nlohmann::json;

// ─── Config Path ─────────────────────────────────────────────────────────────

std::string SettingsManager::getDefaultConfigPath()
{
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (!appdata || appdata[0] == '\0')
        return {};
    return std::string(appdata) + "\\TabFold\\config.json";
#else
    // Non-Windows fallback (for testing on WSL/Linux)
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0')
        return {};
    return std::string(home) + "/.tabfold/config.json";
#endif
}

// ─── Load ────────────────────────────────────────────────────────────────────

bool SettingsManager::loadFromFile(const char* path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    // No-throw parse: corrupt → return false, defaults stay
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return false;

    SettingsSnapshot settings; // Start from defaults

    auto readInt = [&](const char* key, int& target, int lo, int hi) {
        if (j.contains(key) && j[key].is_number_integer())
        {
            int v = j[key].get<int>();
            if (v >= lo && v <= hi)
                target = v;
        }
    };

    readInt("logLevel", settings.logLevel, 0, 3);
    readInt("locationTimeoutMs", settings.locationTimeoutMs, 100, 5000);

    auto readBool = [&](const char* key, bool& target) {
        if (j.contains(key) && j[key].is_boolean())
            target = j[key].get<bool>();
    };

    readBool("autoFoldNewWindows", settings.autoFoldNewWindows);
    readBool("earlyHideOnCreate", settings.earlyHideOnCreate);
    readBool("useRegistrationNotifications", settings.useRegistrationNotifications);
    readBool("openChildFolderInActiveTab", settings.openChildFolderInActiveTab);
    readBool("launchWindowWhenNoTarget", settings.launchWindowWhenNoTarget);
    readBool("logToFile", settings.logToFile);

    // Freeze as const and atomic swap + version bump
    auto snap = std::make_shared<const SettingsSnapshot>(settings);
    std::atomic_store(&current_, snap);
    version_.fetch_add(1, std::memory_order_release);

    for (auto& obs : observers_)
        obs.cb(*snap, obs.userData);

    return true;
}

// ─── Save ────────────────────────────────────────────────────────────────────

bool SettingsManager::saveToFile(const char* path) const
{
    auto snap = snapshot();

    json j;
    j["autoFoldNewWindows"]           = snap->autoFoldNewWindows;
    j["earlyHideOnCreate"]            = snap->earlyHideOnCreate;
    j["useRegistrationNotifications"] = snap->useRegistrationNotifications;
    j["openChildFolderInActiveTab"]   = snap->openChildFolderInActiveTab;
    j["launchWindowWhenNoTarget"]     = snap->launchWindowWhenNoTarget;
    j["logToFile"]                    = snap->logToFile;
    j["logLevel"]                     = snap->logLevel;
    j["locationTimeoutMs"]            = snap->locationTimeoutMs;

    std::error_code ec;
    std::filesystem::path p(path);
    std::filesystem::create_directories(p.parent_path(), ec);
    // Ignore ec: directory may already exist or path may be a bare filename

    std::ofstream file(path);
    if (!file.is_open())
        return false;

    file << j.dump(4);
    return file.good();
}

// ─── Snapshot Access ─────────────────────────────────────────────────────────

std::shared_ptr<const SettingsSnapshot> SettingsManager::snapshot() const
{
    return std::atomic_load(&current_);
}

// ─── Apply ───────────────────────────────────────────────────────────────────

void SettingsManager::applySnapshot(const SettingsSnapshot& newSettings)
{
    auto snap = std::make_shared<const SettingsSnapshot>(newSettings);
    std::atomic_store(&current_, snap);
    version_.fetch_add(1, std::memory_order_release);

    for (auto& obs : observers_)
        obs.cb(newSettings, obs.userData);
}

// ─── Version ─────────────────────────────────────────────────────────────────

uint64_t SettingsManager::version() const
{
    return version_.load(std::memory_order_acquire);
}

// ─── Observer ────────────────────────────────────────────────────────────────

void SettingsManager::addObserver(ChangeCallback cb, void* userData)
{
    observers_.push_back({cb, userData});
}

} // namespace TabFold
