#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <utility>

#include <glm/glm.hpp>

import Core;
import Graphics;

using Graphics::MeshData;
using Graphics::MeshHandle;
using Graphics::MeshStore;

namespace
{
    MeshData OnePoint(float x = 0.0f)
    {
        MeshData mesh;
        mesh.Positions.push_back({x, 0.0f, 0.0f});
        return mesh;
    }
}

TEST(MeshStore, CreateAndGet)
{
    MeshStore store;
    const MeshHandle h = store.Create("Mesh", OnePoint(2.0f));

    ASSERT_TRUE(h.IsValid());
    auto res = store.Get(h);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->Name, "Mesh");
    EXPECT_FLOAT_EQ((*res)->Data.Positions[0].x, 2.0f);
    EXPECT_EQ(store.AliveCount(), 1u);
}

TEST(MeshStore, NamesStayUnique)
{
    MeshStore store;
    const MeshHandle a = store.Create("Mesh", OnePoint());
    const MeshHandle b = store.Create("Mesh", OnePoint());

    EXPECT_EQ((*store.Get(a))->Name, "Mesh");
    EXPECT_EQ((*store.Get(b))->Name, "Mesh.001");
    EXPECT_EQ(store.FindByName("Mesh.001"), b);
    EXPECT_FALSE(store.FindByName("Other").IsValid());
}

TEST(MeshStore, UserCounting)
{
    MeshStore store;
    const MeshHandle h = store.Create("Mesh", OnePoint());

    EXPECT_EQ(store.GetUsers(h), 0u);
    ASSERT_TRUE(store.AddUser(h).has_value());
    ASSERT_TRUE(store.AddUser(h).has_value());
    EXPECT_EQ(store.GetUsers(h), 2u);

    auto remaining = store.RemoveUser(h);
    ASSERT_TRUE(remaining.has_value());
    EXPECT_EQ(*remaining, 1u);
}

TEST(MeshStore, RemoveUserBelowZeroFails)
{
    MeshStore store;
    const MeshHandle h = store.Create("Mesh", OnePoint());

    auto res = store.RemoveUser(h);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Core::ErrorCode::InvalidState);
}

TEST(MeshStore, RemoveRefusesWhileInUse)
{
    MeshStore store;
    const MeshHandle h = store.Create("Mesh", OnePoint());
    ASSERT_TRUE(store.AddUser(h).has_value());

    auto res = store.Remove(h);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Core::ErrorCode::ResourceBusy);
    EXPECT_TRUE(store.IsAlive(h));
}

TEST(MeshStore, StaleHandleAfterSlotReuse)
{
    MeshStore store;
    const MeshHandle old = store.Create("Old", OnePoint());
    ASSERT_TRUE(store.Remove(old).has_value());

    const MeshHandle reused = store.Create("New", OnePoint());
    EXPECT_EQ(reused.Index, old.Index);
    EXPECT_NE(reused.Generation, old.Generation);

    EXPECT_FALSE(store.IsAlive(old));
    auto res = store.Get(old);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_EQ(store.GetUsers(old), 0u);
}

TEST(MeshStore, RenameToFreedName)
{
    MeshStore store;
    const MeshHandle a = store.Create("Mesh", OnePoint());
    const MeshHandle b = store.Create("Mesh", OnePoint());
    ASSERT_TRUE(store.Remove(a).has_value());

    auto renamed = store.Rename(b, "Mesh");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(*renamed, "Mesh");
}

TEST(MeshStore, RenameToTakenNameIsSuffixed)
{
    MeshStore store;
    (void)store.Create("Mesh", OnePoint());
    const MeshHandle b = store.Create("Other", OnePoint());

    auto renamed = store.Rename(b, "Mesh");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(*renamed, "Mesh.001");
}

TEST(MeshStore, RenameKeepsOwnName)
{
    MeshStore store;
    const MeshHandle a = store.Create("Mesh", OnePoint());

    auto renamed = store.Rename(a, "Mesh");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(*renamed, "Mesh");
}

TEST(MeshStore, HandlesHashable)
{
    MeshStore store;
    std::unordered_set<MeshHandle> handles;
    handles.insert(store.Create("A", OnePoint()));
    handles.insert(store.Create("B", OnePoint()));
    EXPECT_EQ(handles.size(), 2u);
}

TEST(MeshStore, Clear)
{
    MeshStore store;
    const MeshHandle h = store.Create("Mesh", OnePoint());
    store.Clear();
    EXPECT_EQ(store.AliveCount(), 0u);
    EXPECT_FALSE(store.IsAlive(h));
}

TEST(MeshData, TranslateMovesPositionsOnly)
{
    MeshData mesh;
    mesh.Positions = {{1.0f, 2.0f, 3.0f}};
    mesh.Normals = {{0.0f, 0.0f, 1.0f}};
    mesh.Translate({-1.0f, -2.0f, -3.0f});

    EXPECT_EQ(mesh.Positions[0], glm::vec3(0.0f));
    EXPECT_EQ(mesh.Normals[0], glm::vec3(0.0f, 0.0f, 1.0f));
}

TEST(MeshData, FindLayer)
{
    MeshData mesh;
    mesh.Layers.push_back({"UVMap", {glm::vec4(0.5f)}});

    ASSERT_NE(mesh.FindLayer("UVMap"), nullptr);
    EXPECT_EQ(mesh.FindLayer("UVMap")->Values.size(), 1u);
    EXPECT_EQ(mesh.FindLayer("Missing"), nullptr);
}

TEST(ErrorCode, NamesTheCodesTheStoreReturns)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::ResourceNotFound), "ResourceNotFound");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::ResourceBusy), "ResourceBusy");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::InvalidState), "InvalidState");
    EXPECT_EQ(Core::ErrorCodeToString(static_cast<Core::ErrorCode>(102)), "Unknown");
}
