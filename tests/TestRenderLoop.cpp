#include <GenViewer/RenderLoop.hpp>
#include <GenViewer/ModelNormalizer.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

using namespace GenViewer;

namespace
{
    // Records what each frame would have drawn
    class RecordingRenderer final : public ISceneRenderer {
    public:
        struct Frame {
            size_t models = 0;
            size_t lights = 0;
            float yaw = 0.0f;
        };

        void render(const SceneGraph& scene) override
        {
            Frame f;
            f.models = scene.modelCount();
            f.lights = scene.lightCount();
            if (const Pivot* p = scene.currentModel()) {
                f.yaw = p->transform().yaw();
            }
            frames.push_back(f);
            events.push_back("render");
        }

        void present() override
        {
            events.push_back("present");
        }

        std::vector<Frame> frames;
        std::vector<std::string> events;
    };

    std::unique_ptr<Pivot> TrianglePivot()
    {
        auto mesh = std::make_shared<Mesh>();
        mesh->positions = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
        mesh->normals.assign(3, glm::vec3(0.0f, 0.0f, 1.0f));
        mesh->indices = {0, 1, 2};
        return ModelNormalizer::normalize(mesh);
    }
}

TEST(RenderLoop, DoesNothingUntilStarted)
{
    ViewerState state;
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    ASSERT_FALSE(loop.tick());
    ASSERT_TRUE(renderer.frames.empty());
    ASSERT_EQ(loop.frameCount(), 0u);
}

TEST(RenderLoop, EmptySceneStillRendersCameraAndLight)
{
    ViewerState state;
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.start();
    ASSERT_TRUE(loop.tick());
    ASSERT_EQ(renderer.frames.size(), 1u);
    ASSERT_EQ(renderer.frames[0].models, 0u);
    ASSERT_EQ(renderer.frames[0].lights, 1u);
}

TEST(RenderLoop, TickAppliesCurrentAngleToPivot)
{
    ViewerState state;
    state.scene.replaceModel(TrianglePivot());
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.start();

    state.rotation.angle = 0.25;
    loop.tick();
    ASSERT_NEAR(renderer.frames.back().yaw, 0.25f, 1e-5f);

    RotationController rc{state.rotation};
    rc.onDrag(250.0);
    loop.tick();
    ASSERT_NEAR(renderer.frames.back().yaw, 0.5f, 1e-5f);
}

TEST(RenderLoop, LargeAnglesAreWrappedBeforeRendering)
{
    ViewerState state;
    state.scene.replaceModel(TrianglePivot());
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.start();

    state.rotation.angle = 1000.0;
    loop.tick();
    ASSERT_NEAR(std::sin(renderer.frames.back().yaw), std::sin(1000.0), 1e-5);
    ASSERT_NEAR(std::cos(renderer.frames.back().yaw), std::cos(1000.0), 1e-5);
    // the stored angle is left unbounded
    ASSERT_DOUBLE_EQ(state.rotation.angle, 1000.0);
}

TEST(RenderLoop, StopMakesFurtherTicksNoOps)
{
    ViewerState state;
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.start();
    loop.tick();
    loop.stop();
    ASSERT_FALSE(loop.isRunning());
    ASSERT_FALSE(loop.tick());
    ASSERT_FALSE(loop.tick());
    ASSERT_EQ(renderer.frames.size(), 1u);

    loop.start();
    ASSERT_TRUE(loop.tick());
    ASSERT_EQ(loop.frameCount(), 2u);
}

TEST(RenderLoop, StopDuringOverlayFinishesCurrentFrame)
{
    ViewerState state;
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.setOverlay([&loop]() { loop.stop(); });
    loop.start();
    ASSERT_TRUE(loop.tick());
    ASSERT_EQ(renderer.events.back(), "present");
    ASSERT_FALSE(loop.tick());
}

TEST(RenderLoop, OverlayDrawsBetweenRenderAndPresent)
{
    ViewerState state;
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.setOverlay([&renderer]() { renderer.events.push_back("overlay"); });
    loop.start();
    loop.tick();
    ASSERT_EQ(renderer.events, (std::vector<std::string>{"render", "overlay", "present"}));
}

TEST(RenderLoop, PicksUpReplacedModelOnNextFrame)
{
    ViewerState state;
    RecordingRenderer renderer;
    RenderLoop loop{state, renderer};
    loop.start();
    loop.tick();
    state.scene.replaceModel(TrianglePivot());
    loop.tick();
    state.scene.replaceModel(TrianglePivot());
    loop.tick();
    ASSERT_EQ(renderer.frames[0].models, 0u);
    ASSERT_EQ(renderer.frames[1].models, 1u);
    ASSERT_EQ(renderer.frames[2].models, 1u);
}
