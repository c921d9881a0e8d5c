#include <GenViewer/ModelLoader.hpp>
#include <TestHelpers.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace GenViewer;
using namespace GenViewer::test;

namespace
{
    std::vector<uint8_t> Bytes(const std::string& s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }
}

TEST(ModelLoader, ParsesObjCubeIntoTriangles)
{
    Mesh mesh;
    std::string err;
    ASSERT_TRUE(ModelLoader::parseMeshFromMemory(Bytes(CubeObj()), "obj", mesh, &err)) << err;
    ASSERT_EQ(mesh.triangleCount(), 12u);
    ASSERT_EQ(mesh.normals.size(), mesh.positions.size());
    for (unsigned int idx : mesh.indices) {
        ASSERT_LT(idx, mesh.vertexCount());
    }
}

TEST(ModelLoader, KeepsAssetModelSpace)
{
    Mesh mesh;
    ASSERT_TRUE(ModelLoader::parseMeshFromMemory(Bytes(CubeObj(10.0f, -2.0f, 4.0f)), "obj", mesh));
    BoundingBox box = mesh.bounds();
    ASSERT_NEAR(box.min.x, 9.0f, 1e-4f);
    ASSERT_NEAR(box.max.x, 11.0f, 1e-4f);
    ASSERT_NEAR(box.center().y, -2.0f, 1e-4f);
    ASSERT_NEAR(box.center().z, 4.0f, 1e-4f);
}

TEST(ModelLoader, EmptyPayloadFails)
{
    Mesh mesh;
    std::string err;
    ASSERT_FALSE(ModelLoader::parseMeshFromMemory({}, "obj", mesh, &err));
    ASSERT_EQ(err, "empty model payload");
}

TEST(ModelLoader, PayloadWithoutFacesFails)
{
    Mesh mesh;
    std::string err;
    ASSERT_FALSE(ModelLoader::parseMeshFromMemory(Bytes("# comment only\n"), "obj", mesh, &err));
    ASSERT_FALSE(err.empty());
    ASSERT_TRUE(mesh.empty());
}

TEST(ModelLoader, FailureLeavesOutputUntouched)
{
    Mesh mesh;
    mesh.name = "previous";
    mesh.positions = {{1.0f, 2.0f, 3.0f}};
    ASSERT_FALSE(ModelLoader::parseMeshFromMemory(Bytes("# nothing\n"), "obj", mesh));
    ASSERT_EQ(mesh.name, "previous");
    ASSERT_EQ(mesh.positions.size(), 1u);
}
