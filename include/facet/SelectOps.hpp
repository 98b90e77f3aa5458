#pragma once

#include "EditMesh.hpp"

namespace facet {

// Selection refinements driven by edge adjacency. Out-of-range input indices
// are dropped.

// Adds every face sharing an edge with the selection
FaceSet growSelection(const EditMesh& mesh, const FaceSet& faces);

// Removes faces on the rim of the selection (neighbour outside, or open edge)
FaceSet shrinkSelection(const EditMesh& mesh, const FaceSet& faces);

// Every face connected to the selection through shared edges
FaceSet selectLinked(const EditMesh& mesh, const FaceSet& faces);

// Faces within angleDegrees of the selection's area-weighted normal
FaceSet selectByNormal(const EditMesh& mesh, const FaceSet& faces, float angleDegrees);

} // namespace facet
