#include <facet/ToolState.hpp>

namespace facet {

const char* operationToString(ModelOperation op) {
    switch (op) {
        case ModelOperation::Select:  return "Select";
        case ModelOperation::Extrude: return "Extrude";
        case ModelOperation::Cut:     return "Cut";
    }
    return "Unknown";
}

ToolState ToolState::fromConfig(const ToolConfig& config) {
    ToolState state;
    state.worldGridSize = config.worldGridSize;
    state.uvGridSize = config.uvGridSize;
    state.surfaceAngleThreshold = config.surfaceAngleThreshold;
    state.xray = config.xray;
    return state;
}

} // namespace facet
