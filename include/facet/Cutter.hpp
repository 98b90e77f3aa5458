#pragma once

#include "EditMesh.hpp"

namespace facet {

struct CutResult {
    EditMesh remaining;   // Faces outside the selection
    EditMesh cutOut;      // Exactly the selected faces

    // Both halves must have triangles for the cut to be committed
    bool isValid() const { return !remaining.empty() && !cutOut.empty(); }
};

/**
 * @brief Split a mesh into the selected faces and the rest.
 *
 * Each half gets its own compacted vertex buffer. Nothing new is generated.
 */
CutResult cutFaces(const EditMesh& mesh, const FaceSet& faces);

// Drops the faces but keeps the vertex buffer as is
EditMesh deleteFaces(const EditMesh& mesh, const FaceSet& faces);

} // namespace facet
