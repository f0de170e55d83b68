module;
#include <string>

export module Sync:Config;

export namespace Sync
{
    struct SyncConfig
    {
        // Quiet period given to newly created links, in seconds.
        double DefaultDebounce = 0.25;

        // Parent new mesh objects to their source, keeping the world placement.
        bool AutoParent = true;

        // New mesh objects are named "<source><TargetSuffix>".
        std::string TargetSuffix = "_N2M";

        bool DefaultApplyModifiers = true;
        bool DefaultPreserveAllDataLayers = true;

        // Log one line per regenerated target.
        bool LogUpdates = true;
    };
}
