#include <GenViewer/ModelLoader.hpp>
#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>
#include <plog/Log.h>
#include <tracy/Tracy.hpp>

namespace GenViewer {

bool ModelLoader::parseMeshFromMemory(const std::vector<uint8_t>& data, const std::string& formatHint, Mesh& out, std::string* outError){
    ZoneScopedN("ModelLoader::parseMeshFromMemory");
    if(data.empty()){
        if(outError) *outError = "empty model payload";
        PLOGW << "loader:empty payload hint=" << formatHint;
        return false;
    }
    Assimp::Importer importer;
    const aiScene* scene = importer.ReadFileFromMemory(data.data(), data.size(), aiProcess_Triangulate|aiProcess_GenNormals|aiProcess_JoinIdenticalVertices|aiProcess_PreTransformVertices, formatHint.c_str());
    if(!scene || !scene->HasMeshes()){
        std::string err = importer.GetErrorString();
        if(err.empty()) err = "no meshes in payload";
        PLOGW << "loader:ReadFileFromMemory failed hint=" << formatHint << " : " << err;
        if(outError) *outError = err;
        return false;
    }

    Mesh mesh;
    mesh.name = formatHint;
    mesh.positions.reserve(1024);
    mesh.normals.reserve(1024);
    mesh.indices.reserve(2048);
    // flatten all meshes (PreTransformVertices already baked node transforms)
    for(unsigned m=0;m<scene->mNumMeshes;++m){
        const aiMesh* am = scene->mMeshes[m];
        unsigned int base = (unsigned int)mesh.positions.size();
        bool hasNormals = am->HasNormals();
        for(unsigned i=0;i<am->mNumVertices;++i){
            aiVector3D v = am->mVertices[i];
            mesh.positions.emplace_back(v.x, v.y, v.z);
            if(hasNormals){ aiVector3D n = am->mNormals[i]; mesh.normals.emplace_back(n.x, n.y, n.z); }
            else mesh.normals.emplace_back(0.0f, 0.0f, 1.0f);
        }
        for(unsigned f=0; f<am->mNumFaces; ++f){
            const aiFace &face = am->mFaces[f];
            if(face.mNumIndices != 3) continue; // points and lines survive Triangulate
            mesh.indices.push_back(base + face.mIndices[0]);
            mesh.indices.push_back(base + face.mIndices[1]);
            mesh.indices.push_back(base + face.mIndices[2]);
        }
    }
    if(mesh.empty()){
        if(outError) *outError = "model contains no triangles";
        PLOGW << "loader:no triangles hint=" << formatHint;
        return false;
    }
    PLOGI << "loader:parsed hint=" << formatHint << " vertices=" << mesh.vertexCount() << " triangles=" << mesh.triangleCount();
    out = std::move(mesh);
    return true;
}

} // namespace GenViewer
