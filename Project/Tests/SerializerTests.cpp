#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Serialization/Serializer.hpp"
#include "Serialization/Diagnostics.hpp"
#include "Serialization/RecordJson.hpp"
#include "Reflection/SchemaRegistry.hpp"
#include "Hierarchy/MemoryObjectModel.hpp"
#include "SerialError.hpp"
#include "TestHelpers.hpp"

using namespace Serial;

class SerializerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        SerialTest::DefineSampleClasses(model);
        registry.BuildSchema(SerialTest::SampleDump());
    }

    ObjectHandle Make(const std::string& className, ObjectHandle parent = NullObject)
    {
        ObjectHandle object = model.Create(className);
        if (parent != NullObject) model.SetParent(object, parent);
        return object;
    }

    static void CollectIds(const SerializedRecord& record, std::vector<std::int64_t>& out)
    {
        out.push_back(record.id);
        for (const auto& child : record.children) CollectIds(child, out);
    }

    SchemaRegistry registry;
    MemoryObjectModel model;
    InstanceSerializer serializer{ registry, model };
};

TEST_F(SerializerTest, GroupWithTwoLeaves)
{
    ObjectHandle group = Make("Group");
    ObjectHandle first = Make("Leaf", group);
    ObjectHandle second = Make("Leaf", group);
    model.SetProperty(first, "X", 5.0);
    model.SetProperty(second, "LinkedLeaf", ObjectRef{ first });

    auto record = serializer.SerializeTree(group);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->type, "Group");
    EXPECT_EQ(record->id, 1);
    EXPECT_TRUE(record->properties.empty());
    ASSERT_EQ(record->children.size(), 2u);

    const SerializedRecord& a = record->children[0];
    EXPECT_EQ(a.type, "Leaf");
    EXPECT_EQ(a.id, 2);
    ASSERT_EQ(a.properties.size(), 1u);
    EXPECT_EQ(std::get<double>(a.properties.at("X")), 5.0);

    const SerializedRecord& b = record->children[1];
    EXPECT_EQ(b.id, 3);
    ASSERT_EQ(b.properties.size(), 1u);
    EXPECT_EQ(std::get<std::int64_t>(b.properties.at("LinkedLeaf")), 2);

    EXPECT_EQ(RecordToJson(*record),
              R"({"Type":"Group","Id":1,"Properties":{},"Children":[)"
              R"({"Type":"Leaf","Id":2,"Properties":{"X":5.0}},)"
              R"({"Type":"Leaf","Id":3,"Properties":{"LinkedLeaf":2}}]})");

    auto copy = serializer.DeserializeTree(*record);
    ASSERT_TRUE(copy.has_value());
    EXPECT_NE(*copy, group);
    EXPECT_EQ(model.GetClassName(*copy), "Group");

    auto kids = model.GetChildren(*copy);
    ASSERT_EQ(kids.size(), 2u);
    EXPECT_EQ(std::get<double>(model.GetProperty(kids[0], "X")), 5.0);
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[1], "LinkedLeaf")).handle, kids[0]);
    EXPECT_NE(kids[0], first);
}

TEST_F(SerializerTest, FreshObjectsSerializeWithoutProperties)
{
    for (const auto& className : registry.GetClassNames()) {
        if (!registry.IsInstantiable(className)) continue;

        Diagnostics diagnostics;
        auto record = serializer.SerializeTree(Make(className), &diagnostics);
        ASSERT_TRUE(record.has_value()) << className;
        EXPECT_TRUE(record->properties.empty()) << className;
        EXPECT_TRUE(record->tags.empty()) << className;
        EXPECT_TRUE(record->attributes.empty()) << className;
        EXPECT_TRUE(diagnostics.Empty()) << className;
    }
}

TEST_F(SerializerTest, DefaultsAreResolvedOncePerClass)
{
    ObjectHandle group = Make("Group");
    for (int i = 0; i < 4; ++i) Make("Leaf", group);
    const size_t before = model.CreatedCount();

    ASSERT_TRUE(serializer.SerializeTree(group).has_value());
    ASSERT_TRUE(serializer.SerializeTree(group).has_value());

    // One transient Group and one transient Leaf, ever
    EXPECT_EQ(model.CreatedCount(), before + 2);
    EXPECT_EQ(model.ObjectCount(), 5u);
}

TEST_F(SerializerTest, IdsArePreOrderAndContiguous)
{
    ObjectHandle root = Make("Group");
    ObjectHandle inner = Make("Group", root);
    Make("Leaf", inner);
    Make("Leaf", inner);
    Make("Leaf", root);

    auto record = serializer.SerializeTree(root);
    ASSERT_TRUE(record.has_value());

    std::vector<std::int64_t> ids;
    CollectIds(*record, ids);
    std::vector<std::int64_t> expected = { 1, 2, 3, 4, 5 };
    EXPECT_EQ(ids, expected);
    EXPECT_EQ(record->children[0].children[1].id, 4);
    EXPECT_EQ(record->children[1].id, 5);
    EXPECT_EQ(CountRecords(*record), 5u);
}

TEST_F(SerializerTest, NonInstantiableChildIsOmittedWithItsSubtree)
{
    ObjectHandle root = Make("Group");
    Make("Leaf", root);
    ObjectHandle camera = Make("Camera", root);
    Make("Leaf", camera);
    Make("Leaf", root);

    Diagnostics diagnostics;
    auto record = serializer.SerializeTree(root, &diagnostics);
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->children.size(), 2u);
    EXPECT_EQ(record->children[0].id, 2);
    EXPECT_EQ(record->children[1].id, 3);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::NotInstantiable), 1u);
}

TEST_F(SerializerTest, NonInstantiableRootYieldsNothing)
{
    Diagnostics diagnostics;
    EXPECT_FALSE(serializer.SerializeTree(Make("Camera"), &diagnostics).has_value());
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::NotInstantiable), 1u);
}

TEST_F(SerializerTest, InvalidInputsThrow)
{
    EXPECT_THROW(serializer.SerializeTree(NullObject), MalformedInputError);
    EXPECT_THROW(serializer.SerializeTree(12345), MalformedInputError);

    SerializedRecord untyped;
    untyped.id = 1;
    EXPECT_THROW(serializer.DeserializeTree(untyped), MalformedInputError);

    SerializedRecord leaf;
    leaf.id = 1;
    leaf.type = "Leaf";
    EXPECT_THROW(serializer.DeserializeTree(leaf, 12345), MalformedInputError);
}

TEST(SerializerLifecycleTest, RequiresABuiltSchema)
{
    SchemaRegistry registry;
    MemoryObjectModel model;
    SerialTest::DefineSampleClasses(model);
    InstanceSerializer serializer(registry, model);

    SerializedRecord leaf;
    leaf.id = 1;
    leaf.type = "Leaf";
    EXPECT_THROW(serializer.SerializeTree(model.Create("Leaf")), SchemaNotBuiltError);
    EXPECT_THROW(serializer.DeserializeTree(leaf), SchemaNotBuiltError);
}

TEST_F(SerializerTest, ReferencesOutsideTheTreeAreDropped)
{
    ObjectHandle outside = Make("Leaf");
    ObjectHandle group = Make("Group");
    ObjectHandle leaf = Make("Leaf", group);
    model.SetProperty(leaf, "LinkedLeaf", ObjectRef{ outside });

    Diagnostics diagnostics;
    auto record = serializer.SerializeTree(group, &diagnostics);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->children[0].properties.count("LinkedLeaf"), 0u);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DanglingReference), 1u);

    auto copy = serializer.DeserializeTree(*record);
    ASSERT_TRUE(copy.has_value());
    ObjectHandle copiedLeaf = model.GetChildren(*copy)[0];
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(copiedLeaf, "LinkedLeaf")).handle, NullObject);
}

TEST_F(SerializerTest, UnresolvableIdsAreSkipped)
{
    SerializedRecord record = RecordFromJson(R"({"Type":"Leaf","Id":1,"Properties":{"LinkedLeaf":99,"X":2}})");

    Diagnostics diagnostics;
    auto leaf = serializer.DeserializeTree(record, NullObject, &diagnostics);
    ASSERT_TRUE(leaf.has_value());
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(*leaf, "LinkedLeaf")).handle, NullObject);
    EXPECT_EQ(std::get<double>(model.GetProperty(*leaf, "X")), 2.0);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DanglingReference), 1u);
}

TEST_F(SerializerTest, NonIntegralReferenceIdsAreRejected)
{
    SerializedRecord record = RecordFromJson(R"({"Type":"Group","Id":1,"Properties":{},"Children":[
        {"Type":"Leaf","Id":2,"Properties":{"LinkedLeaf":Infinity}},
        {"Type":"Leaf","Id":3,"Properties":{"LinkedLeaf":-Infinity}},
        {"Type":"Leaf","Id":4,"Properties":{"LinkedLeaf":NaN}},
        {"Type":"Leaf","Id":5,"Properties":{"LinkedLeaf":1e300}},
        {"Type":"Leaf","Id":6,"Properties":{"LinkedLeaf":2.0}}]})");

    Diagnostics diagnostics;
    auto group = serializer.DeserializeTree(record, NullObject, &diagnostics);
    ASSERT_TRUE(group.has_value());

    auto kids = model.GetChildren(*group);
    ASSERT_EQ(kids.size(), 5u);
    for (size_t i = 0; i < 4; ++i)
        EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[i], "LinkedLeaf")).handle, NullObject) << i;
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[4], "LinkedLeaf")).handle, kids[0]);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DecodeFailure), 4u);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DanglingReference), 0u);
}

TEST_F(SerializerTest, SelfAndMutualReferencesLinkToCopies)
{
    ObjectHandle group = Make("Group");
    ObjectHandle a = Make("Leaf", group);
    ObjectHandle b = Make("Leaf", group);
    model.SetProperty(a, "LinkedLeaf", ObjectRef{ b });
    model.SetProperty(b, "LinkedLeaf", ObjectRef{ b });

    auto record = serializer.SerializeTree(group);
    ASSERT_TRUE(record.has_value());

    auto copy = serializer.DeserializeTree(*record);
    ASSERT_TRUE(copy.has_value());
    auto kids = model.GetChildren(*copy);
    ASSERT_EQ(kids.size(), 2u);
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[0], "LinkedLeaf")).handle, kids[1]);
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[1], "LinkedLeaf")).handle, kids[1]);
}

TEST_F(SerializerTest, PartPropertiesTagsAndAttributesRoundTrip)
{
    ObjectHandle part = Make("Part");
    CFrame cf;
    cf.position = Vector3(1.0f, 2.5f, -3.0f);
    SetRotationComponent(cf, 0, 0, 0.0f);
    SetRotationComponent(cf, 0, 2, 1.0f);
    SetRotationComponent(cf, 2, 0, -1.0f);
    SetRotationComponent(cf, 2, 2, 0.0f);

    model.SetProperty(part, "Name", std::string("Crate"));
    model.SetProperty(part, "Anchored", true);
    model.SetProperty(part, "Size", Vector3(2.0f, 2.0f, 2.0f));
    model.SetProperty(part, "CFrame", cf);
    model.SetProperty(part, "Color", Color3{ 0.5f, 0.25f, 1.0f });
    model.SetProperty(part, "BrickColor", BrickColor{ "Bright red" });
    model.SetProperty(part, "Material", EnumItem{ "Material", "Wood", 512 });
    model.SetProperty(part, "Shape", EnumItem{ "PartType", "Ball", 0 });
    model.SetProperty(part, "CustomPhysicalProperties", PhysicalProperties{ 0.7f, 0.3f, 0.5f, 1.0f, 1.0f });
    model.AddTag(part, "Pickup");
    model.AddTag(part, "Wooden");
    model.SetAttribute(part, "Health", 87.5);
    model.SetAttribute(part, "Level", std::int64_t{ 3 });
    model.SetAttribute(part, "Owner", std::string("nobody"));
    model.SetAttribute(part, "Glows", false);
    model.SetAttribute(part, "Spawn", Vector3(0.0f, 10.0f, 0.0f));
    model.SetAttribute(part, "Tint", Color3{ 1.0f, 0.0f, 0.0f });

    Diagnostics diagnostics;
    auto record = serializer.SerializeTree(part, &diagnostics);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(diagnostics.Empty());
    EXPECT_EQ(record->properties.size(), 9u);
    EXPECT_EQ(std::get<std::string>(record->properties.at("Material")), "Material.Wood");
    EXPECT_EQ(record->attributes.at("Spawn").typeTag, "Vector3");
    EXPECT_EQ(record->attributes.at("Health").typeTag, "number");

    // Through the wire text as well
    auto copy = serializer.DeserializeTreeFromJson(RecordToJson(*record), NullObject, &diagnostics);
    ASSERT_TRUE(copy.has_value());
    EXPECT_TRUE(diagnostics.Empty());

    for (const char* name : { "Name", "Anchored", "Size", "CFrame", "Color", "BrickColor", "Material", "Shape",
                              "CustomPhysicalProperties", "Position" }) {
        EXPECT_EQ(model.GetProperty(*copy, name), model.GetProperty(part, name)) << name;
    }
    EXPECT_EQ(model.GetTags(*copy), model.GetTags(part));
    EXPECT_EQ(model.GetAttributes(*copy), model.GetAttributes(part));
    EXPECT_EQ(std::get<EnumItem>(model.GetProperty(*copy, "Material")).value, 512);
}

TEST_F(SerializerTest, GuiCompositesRoundTrip)
{
    ObjectHandle gui = Make("Gui");
    NumberSequence fade;
    fade.keypoints = { { 0.0f, 0.0f, 0.0f }, { 0.5f, 0.75f, 0.125f }, { 1.0f, 1.0f, 0.0f } };

    model.SetProperty(gui, "Position", UDim2{ { 0.5f, -20.0f }, { 0.25f, 8.0f } });
    model.SetProperty(gui, "Padding", UDim{ 0.0f, 4.0f });
    model.SetProperty(gui, "FontFace", Font{ "Gotham", "Bold", "Italic" });
    model.SetProperty(gui, "Transparency", fade);
    model.SetProperty(gui, "Lifetime", NumberRange{ 0.5f, 2.0f });
    model.SetProperty(gui, "Offset", Vector2(3.0f, -3.0f));
    model.SetProperty(gui, "Tint", Color3{ 1.0f, 0.0f, 0.2f });

    auto record = serializer.SerializeTree(gui);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->properties.size(), 7u);

    auto copy = serializer.DeserializeTree(*record);
    ASSERT_TRUE(copy.has_value());
    for (const char* name : { "Position", "Padding", "FontFace", "Transparency", "Lifetime", "Offset" }) {
        EXPECT_EQ(model.GetProperty(*copy, name), model.GetProperty(gui, name)) << name;
    }

    Color3 tint = std::get<Color3>(model.GetProperty(*copy, "Tint"));
    EXPECT_FLOAT_EQ(tint.r, 1.0f);
    EXPECT_FLOAT_EQ(tint.g, 0.0f);
    EXPECT_NEAR(tint.b, 0.2f, 1.0f / 255.0f);
}

TEST_F(SerializerTest, UnknownTypesNeverRaise)
{
    ObjectHandle part = Make("Part");
    model.SetProperty(part, "SurfaceTag", std::string("Bottom"));
    model.SetProperty(part, "Bounds", Vector3(1.0f, 2.0f, 3.0f));

    Diagnostics diagnostics;
    auto record = serializer.SerializeTree(part, &diagnostics);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(std::get<std::string>(record->properties.at("SurfaceTag")), "Bottom");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(record->properties.at("Bounds")));
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::UnknownType), 2u);

    diagnostics.Clear();
    auto copy = serializer.DeserializeTree(*record, NullObject, &diagnostics);
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(std::get<std::string>(model.GetProperty(*copy, "SurfaceTag")), "Bottom");
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::UnknownType), 2u);
}

TEST_F(SerializerTest, SchemaDriftAndBadValuesAreSkipped)
{
    SerializedRecord record = RecordFromJson(
        R"({"Type":"Part","Id":1,"Properties":{"Anchored":true,"Nope":1,"Size":"!!!!","Color":"AAAA"}})");

    Diagnostics diagnostics;
    auto part = serializer.DeserializeTree(record, NullObject, &diagnostics);
    ASSERT_TRUE(part.has_value());
    EXPECT_EQ(std::get<bool>(model.GetProperty(*part, "Anchored")), true);
    EXPECT_EQ(std::get<Vector3>(model.GetProperty(*part, "Size")), Vector3(4.0f, 1.0f, 2.0f));
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::MissingSchema), 1u);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DecodeFailure), 2u);
}

TEST_F(SerializerTest, FailedParentDropsItsSubtree)
{
    SerializedRecord record = RecordFromJson(R"({"Type":"Group","Id":1,"Properties":{},"Children":[
        {"Type":"Camera","Id":2,"Properties":{},"Children":[{"Type":"Leaf","Id":3,"Properties":{}}]},
        {"Type":"Leaf","Id":4,"Properties":{"LinkedLeaf":3}}]})");

    Diagnostics diagnostics;
    auto group = serializer.DeserializeTree(record, NullObject, &diagnostics);
    ASSERT_TRUE(group.has_value());

    auto kids = model.GetChildren(*group);
    ASSERT_EQ(kids.size(), 1u);
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[0], "LinkedLeaf")).handle, NullObject);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::NotInstantiable), 1u);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DanglingReference), 1u);
}

TEST_F(SerializerTest, NonInstantiableRootRecordYieldsNothing)
{
    SerializedRecord record = RecordFromJson(R"({"Type":"Camera","Id":1,"Properties":{}})");
    EXPECT_FALSE(serializer.DeserializeTree(record).has_value());

    record.type = "Spaceship";
    EXPECT_FALSE(serializer.DeserializeTree(record).has_value());
}

TEST_F(SerializerTest, DuplicateIdsKeepTheFirstObject)
{
    SerializedRecord record = RecordFromJson(R"({"Type":"Group","Id":1,"Properties":{},"Children":[
        {"Type":"Leaf","Id":2,"Properties":{"X":1}},
        {"Type":"Leaf","Id":2,"Properties":{"X":2,"LinkedLeaf":2}},
        {"Type":"Leaf","Id":3,"Properties":{"LinkedLeaf":2}}]})");

    Diagnostics diagnostics;
    auto group = serializer.DeserializeTree(record, NullObject, &diagnostics);
    ASSERT_TRUE(group.has_value());

    auto kids = model.GetChildren(*group);
    ASSERT_EQ(kids.size(), 3u);
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[1], "LinkedLeaf")).handle, kids[0]);
    EXPECT_EQ(std::get<ObjectRef>(model.GetProperty(kids[2], "LinkedLeaf")).handle, kids[0]);
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::DuplicateId), 1u);
}

TEST_F(SerializerTest, RootIsParentedAfterLinking)
{
    ObjectHandle folder = Make("Group");
    Make("Leaf", folder);

    ObjectHandle source = Make("Leaf");
    model.SetProperty(source, "Label", std::string("copied"));
    auto record = serializer.SerializeTree(source);
    ASSERT_TRUE(record.has_value());

    auto copy = serializer.DeserializeTree(*record, folder);
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(model.GetParent(*copy), folder);
    EXPECT_EQ(model.GetChildren(folder).back(), *copy);
    EXPECT_EQ(std::get<std::string>(model.GetProperty(*copy, "Label")), "copied");
}

TEST_F(SerializerTest, ChildOrderIsPreserved)
{
    ObjectHandle group = Make("Group");
    const std::vector<std::string> labels = { "e", "a", "d", "b", "c" };
    for (const auto& label : labels) model.SetProperty(Make("Leaf", group), "Label", label);

    auto json = serializer.SerializeTreeToJson(group);
    ASSERT_TRUE(json.has_value());

    auto copy = serializer.DeserializeTreeFromJson(*json);
    ASSERT_TRUE(copy.has_value());

    std::vector<std::string> copied;
    for (ObjectHandle kid : model.GetChildren(*copy)) copied.push_back(std::get<std::string>(model.GetProperty(kid, "Label")));
    EXPECT_EQ(copied, labels);
}

TEST_F(SerializerTest, HostReadFailuresAreReported)
{
    ObjectHandle leaf = Make("Leaf");
    model.SetProperty(leaf, "X", 9.0);
    model.MarkUnreadable("Leaf", "Label");

    Diagnostics diagnostics;
    auto record = serializer.SerializeTree(leaf, &diagnostics);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(std::get<double>(record->properties.at("X")), 9.0);
    EXPECT_EQ(record->properties.count("Label"), 0u);
    // Once while resolving defaults, once while reading the live object
    EXPECT_EQ(diagnostics.Count(DiagnosticKind::HostFailure), 2u);
}
