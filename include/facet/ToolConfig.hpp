#pragma once

#include <string>

namespace facet {

// Tool defaults and limits, loadable from a JSON file
struct ToolConfig {
    int version = 1;

    // Initial selection parameters
    float worldGridSize = 0.5f;
    float uvGridSize = 0.1f;
    float surfaceAngleThreshold = 30.0f;   // Degrees
    bool xray = false;

    // Grid size limits for the +/- intents
    float minWorldGridSize = 0.125f;
    float maxWorldGridSize = 8.0f;
    float minUVGridSize = 0.01f;
    float maxUVGridSize = 1.0f;
    float surfaceAngleStep = 5.0f;
    float minSurfaceAngle = 1.0f;
    float maxSurfaceAngle = 90.0f;

    // A freeform click this close (world units) to the first point closes the lasso
    float freeformCloseRadius = 0.3f;

    // Extrude confirm rejects anything shorter
    float minExtrudeDistance = 1e-6f;
};

class ToolConfigSerializer {
public:
    // Write config as pretty-printed JSON
    static bool save(const std::string& filepath, const ToolConfig& config);

    // Read config; keys missing from the file keep their current values
    static bool load(const std::string& filepath, ToolConfig& outConfig);

    // Check limits are ordered and the starting values sit inside them
    static bool validate(const ToolConfig& config);

    static const std::string& getLastError() { return s_lastError; }

private:
    static std::string s_lastError;
};

} // namespace facet
