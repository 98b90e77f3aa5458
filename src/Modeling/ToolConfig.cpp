#include <facet/ToolConfig.hpp>

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace facet {

std::string ToolConfigSerializer::s_lastError;

static bool inRange(float value, float lo, float hi) {
    return value >= lo && value <= hi;
}

bool ToolConfigSerializer::validate(const ToolConfig& config) {
    if (!(config.minWorldGridSize > 0.0f) || config.minWorldGridSize > config.maxWorldGridSize ||
        !(config.minUVGridSize > 0.0f) || config.minUVGridSize > config.maxUVGridSize) {
        s_lastError = "Invalid grid size limits";
        return false;
    }
    if (!(config.minSurfaceAngle > 0.0f) || config.minSurfaceAngle > config.maxSurfaceAngle ||
        config.maxSurfaceAngle > 180.0f) {
        s_lastError = "Invalid surface angle limits";
        return false;
    }
    if (!(config.surfaceAngleStep > 0.0f)) {
        s_lastError = "Surface angle step must be positive";
        return false;
    }
    if (!inRange(config.worldGridSize, config.minWorldGridSize, config.maxWorldGridSize)) {
        s_lastError = "World grid size outside its limits";
        return false;
    }
    if (!inRange(config.uvGridSize, config.minUVGridSize, config.maxUVGridSize)) {
        s_lastError = "UV grid size outside its limits";
        return false;
    }
    if (!inRange(config.surfaceAngleThreshold, config.minSurfaceAngle, config.maxSurfaceAngle)) {
        s_lastError = "Surface angle threshold outside its limits";
        return false;
    }
    if (!(config.freeformCloseRadius > 0.0f)) {
        s_lastError = "Freeform close radius must be positive";
        return false;
    }
    if (!(config.minExtrudeDistance >= 0.0f)) {
        s_lastError = "Minimum extrude distance must not be negative";
        return false;
    }
    return true;
}

bool ToolConfigSerializer::save(const std::string& filepath, const ToolConfig& config) {
    try {
        json root;
        root["version"] = config.version;

        json selection;
        selection["worldGridSize"] = config.worldGridSize;
        selection["uvGridSize"] = config.uvGridSize;
        selection["surfaceAngleThreshold"] = config.surfaceAngleThreshold;
        selection["xray"] = config.xray;
        root["selection"] = selection;

        json limits;
        limits["minWorldGridSize"] = config.minWorldGridSize;
        limits["maxWorldGridSize"] = config.maxWorldGridSize;
        limits["minUVGridSize"] = config.minUVGridSize;
        limits["maxUVGridSize"] = config.maxUVGridSize;
        limits["surfaceAngleStep"] = config.surfaceAngleStep;
        limits["minSurfaceAngle"] = config.minSurfaceAngle;
        limits["maxSurfaceAngle"] = config.maxSurfaceAngle;
        root["limits"] = limits;

        root["freeformCloseRadius"] = config.freeformCloseRadius;
        root["minExtrudeDistance"] = config.minExtrudeDistance;

        std::ofstream file(filepath);
        if (!file.is_open()) {
            s_lastError = "Failed to open file for writing: " + filepath;
            return false;
        }

        file << root.dump(2);
        file.close();

        std::cout << "[ToolConfig] Saved config to: " << filepath << std::endl;
        return true;

    } catch (const std::exception& e) {
        s_lastError = std::string("Save failed: ") + e.what();
        return false;
    }
}

bool ToolConfigSerializer::load(const std::string& filepath, ToolConfig& outConfig) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            s_lastError = "Failed to open file: " + filepath;
            return false;
        }

        json root = json::parse(file);
        file.close();

        if (!root.is_object()) {
            s_lastError = "Config root must be an object: " + filepath;
            return false;
        }

        ToolConfig config = outConfig;
        config.version = root.value("version", config.version);

        if (root.contains("selection")) {
            const auto& selection = root["selection"];
            config.worldGridSize = selection.value("worldGridSize", config.worldGridSize);
            config.uvGridSize = selection.value("uvGridSize", config.uvGridSize);
            config.surfaceAngleThreshold = selection.value("surfaceAngleThreshold", config.surfaceAngleThreshold);
            config.xray = selection.value("xray", config.xray);
        }

        if (root.contains("limits")) {
            const auto& limits = root["limits"];
            config.minWorldGridSize = limits.value("minWorldGridSize", config.minWorldGridSize);
            config.maxWorldGridSize = limits.value("maxWorldGridSize", config.maxWorldGridSize);
            config.minUVGridSize = limits.value("minUVGridSize", config.minUVGridSize);
            config.maxUVGridSize = limits.value("maxUVGridSize", config.maxUVGridSize);
            config.surfaceAngleStep = limits.value("surfaceAngleStep", config.surfaceAngleStep);
            config.minSurfaceAngle = limits.value("minSurfaceAngle", config.minSurfaceAngle);
            config.maxSurfaceAngle = limits.value("maxSurfaceAngle", config.maxSurfaceAngle);
        }

        config.freeformCloseRadius = root.value("freeformCloseRadius", config.freeformCloseRadius);
        config.minExtrudeDistance = root.value("minExtrudeDistance", config.minExtrudeDistance);

        if (!validate(config)) {
            s_lastError += " in: " + filepath;
            return false;
        }

        outConfig = config;
        std::cout << "[ToolConfig] Loaded config from: " << filepath << std::endl;
        return true;

    } catch (const std::exception& e) {
        s_lastError = std::string("Load failed: ") + e.what();
        return false;
    }
}

} // namespace facet
