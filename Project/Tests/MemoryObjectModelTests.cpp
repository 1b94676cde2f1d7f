#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Hierarchy/MemoryObjectModel.hpp"
#include "SerialError.hpp"
#include "TestHelpers.hpp"

using namespace Serial;

class MemoryObjectModelTest : public ::testing::Test {
protected:
    void SetUp() override { SerialTest::DefineSampleClasses(model); }

    MemoryObjectModel model;
};

TEST_F(MemoryObjectModelTest, CreateAppliesInheritedDefaults)
{
    ObjectHandle part = model.Create("Part");
    EXPECT_TRUE(model.IsValid(part));
    EXPECT_EQ(model.GetClassName(part), "Part");
    EXPECT_EQ(std::get<std::string>(model.GetProperty(part, "Name")), "Part");
    EXPECT_EQ(std::get<bool>(model.GetProperty(part, "Archivable")), true);
    EXPECT_EQ(std::get<Vector3>(model.GetProperty(part, "Size")), Vector3(4.0f, 1.0f, 2.0f));
    EXPECT_EQ(model.GetParent(part), NullObject);
}

TEST_F(MemoryObjectModelTest, UnknownClassesAndPropertiesThrow)
{
    EXPECT_THROW(model.Create("Spaceship"), HostError);

    ObjectHandle leaf = model.Create("Leaf");
    EXPECT_THROW(model.GetProperty(leaf, "Size"), HostError);
    EXPECT_THROW(model.SetProperty(leaf, "Size", Vector3(1.0f)), HostError);
    EXPECT_THROW(model.GetClassName(9999), HostError);
}

TEST_F(MemoryObjectModelTest, ChildrenKeepInsertionOrder)
{
    ObjectHandle group = model.Create("Group");
    ObjectHandle a = model.Create("Leaf");
    ObjectHandle b = model.Create("Leaf");
    ObjectHandle c = model.Create("Leaf");
    model.SetParent(b, group);
    model.SetParent(a, group);
    model.SetParent(c, group);

    std::vector<ObjectHandle> expected = { b, a, c };
    EXPECT_EQ(model.GetChildren(group), expected);
    EXPECT_EQ(model.GetParent(a), group);
}

TEST_F(MemoryObjectModelTest, ReparentingMovesTheObject)
{
    ObjectHandle first = model.Create("Group");
    ObjectHandle second = model.Create("Group");
    ObjectHandle leaf = model.Create("Leaf");

    model.SetParent(leaf, first);
    model.SetParent(leaf, second);
    EXPECT_TRUE(model.GetChildren(first).empty());
    ASSERT_EQ(model.GetChildren(second).size(), 1u);

    model.SetParent(leaf, NullObject);
    EXPECT_TRUE(model.GetChildren(second).empty());
    EXPECT_EQ(model.GetParent(leaf), NullObject);
}

TEST_F(MemoryObjectModelTest, ParentCyclesAreRejected)
{
    ObjectHandle outer = model.Create("Group");
    ObjectHandle inner = model.Create("Group");
    model.SetParent(inner, outer);

    EXPECT_THROW(model.SetParent(outer, inner), HostError);
    EXPECT_THROW(model.SetParent(outer, outer), HostError);
}

TEST_F(MemoryObjectModelTest, DestroyRemovesSubtreeAndClearsReferences)
{
    ObjectHandle group = model.Create("Group");
    ObjectHandle child = model.Create("Leaf");
    ObjectHandle grandchild = model.Create("Leaf");
    ObjectHandle survivor = model.Create("Leaf");
    model.SetParent(child, group);
    model.SetParent(grandchild, child);
    model.SetProperty(survivor, "LinkedLeaf", ObjectRef{ grandchild });

    model.Destroy(child);

    EXPECT_FALSE(model.IsValid(child));
    EXPECT_FALSE(model.IsValid(grandchild));
    EXPECT_TRUE(model.GetChildren(group).empty());
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(survivor, "LinkedLeaf")).handle, NullObject);
    EXPECT_THROW(model.SetProperty(survivor, "LinkedLeaf", ObjectRef{ child }), HostError);
}

TEST_F(MemoryObjectModelTest, TagsAreUnique)
{
    ObjectHandle leaf = model.Create("Leaf");
    model.AddTag(leaf, "Enemy");
    model.AddTag(leaf, "Boss");
    model.AddTag(leaf, "Enemy");

    std::vector<std::string> expected = { "Enemy", "Boss" };
    EXPECT_EQ(model.GetTags(leaf), expected);
}

TEST_F(MemoryObjectModelTest, AttributesAreNameOrderedAndNullRemoves)
{
    ObjectHandle leaf = model.Create("Leaf");
    model.SetAttribute(leaf, "zeta", std::int64_t{ 1 });
    model.SetAttribute(leaf, "alpha", std::string("a"));
    model.SetAttribute(leaf, "mid", true);
    model.SetAttribute(leaf, "mid", Value{});

    auto attributes = model.GetAttributes(leaf);
    ASSERT_EQ(attributes.size(), 2u);
    EXPECT_EQ(attributes.begin()->first, "alpha");
    EXPECT_EQ(attributes.rbegin()->first, "zeta");
}

TEST_F(MemoryObjectModelTest, UnreadablePropertiesThrowOnRead)
{
    model.MarkUnreadable("Leaf", "Label");
    ObjectHandle leaf = model.Create("Leaf");
    EXPECT_THROW(model.GetProperty(leaf, "Label"), HostError);
    EXPECT_NO_THROW(model.SetProperty(leaf, "Label", std::string("ok")));
    EXPECT_THROW(model.MarkUnreadable("Spaceship", "Fuel"), HostError);
}
