#pragma once
// =============================================================================
// TabFold — SettingsManager
// Loads, validates, saves config.json. Thread-safe snapshot model.
// =============================================================================

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace TabFold
{

struct SettingsSnapshot
{
    bool    autoFoldNewWindows            = true;  // fold new single-tab windows automatically
    bool    earlyHideOnCreate             = true;  // hide on object-create before classification
    bool    useRegistrationNotifications  = true;  // prefer the window-registered channel
    bool    openChildFolderInActiveTab    = true;  // on-demand: navigate foreground tab to child paths
    bool    launchWindowWhenNoTarget      = true;  // on-demand: plain window if nothing to fold into
    bool    logToFile                     = false;
    int     logLevel                      = 1;     // 0=verbose, 1=info, 2=warn, 3=error
    int     locationTimeoutMs             = 500;   // source location stabilisation budget
};

class SettingsManager
{
public:
    // Load settings from JSON file. Returns false on missing/corrupt file
    // (defaults remain in effect). Call snapshot() to read values.
    bool loadFromFile(const char* path);

    // Save current settings to JSON file. Creates parent directories if needed.
    bool saveToFile(const char* path) const;

    // Thread-safe snapshot read: no locks. Uses std::atomic_load on shared_ptr.
    std::shared_ptr<const SettingsSnapshot> snapshot() const;

    // Apply a modified snapshot: atomic-swaps, bumps version, notifies observers.
    void applySnapshot(const SettingsSnapshot& newSettings);

    // Default config file path: %AppData%\TabFold\config.json (or $HOME on non-Windows)
    static std::string getDefaultConfigPath();

    // Observer pattern (main thread only, low-frequency).
    // Called synchronously during applySnapshot() and loadFromFile().
    using ChangeCallback = void(*)(const SettingsSnapshot&, void* userData);
    void addObserver(ChangeCallback cb, void* userData);

    uint64_t version() const;

private:
    std::shared_ptr<const SettingsSnapshot> current_ = std::make_shared<SettingsSnapshot>();
    std::atomic<uint64_t> version_{0};

    struct Observer { ChangeCallback cb; void* userData; };
    std::vector<Observer> observers_;
};

} // namespace TabFold
