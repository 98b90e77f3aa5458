#pragma once

// Facet mesh editing - Main Include
// Include this single header to use the face modeling engine

#include "Geometry.hpp"
#include "Transform.hpp"
#include "Camera.hpp"
#include "RenderableMesh.hpp"
#include "EditMesh.hpp"
#include "FacePicker.hpp"
#include "RegionSelector.hpp"
#include "SelectOps.hpp"
#include "Extruder.hpp"
#include "Cutter.hpp"
#include "EditSession.hpp"
#include "ToolConfig.hpp"
#include "ToolState.hpp"
#include "ExtrudeDrag.hpp"
#include "IModelingHost.hpp"
#include "ToolController.hpp"
