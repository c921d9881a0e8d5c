#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <GenViewer/Mesh.hpp>

namespace GenViewer {

// Assimp-backed parser for downloaded model payloads
struct ModelLoader {
    // Parse `data` into a single flattened, triangulated mesh in the asset's own
    // model space (no recentering; that is ModelNormalizer's job).
    // `formatHint` is a file extension ("obj", "glb", ...) or a file name.
    // Returns false and fills outError when the payload has no usable triangles.
    static bool parseMeshFromMemory(const std::vector<uint8_t>& data, const std::string& formatHint, Mesh& out, std::string* outError = nullptr);
};

} // namespace GenViewer
