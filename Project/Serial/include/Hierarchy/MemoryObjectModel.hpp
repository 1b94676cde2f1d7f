#pragma once
/*********************************************************************************
* @File         MemoryObjectModel.hpp
* @Brief        In-process IObjectModel. Classes are registered as prototypes (default
*               property values plus an optional superclass whose properties are
*               inherited); objects live in a handle-keyed table with ordered children.
*               Destroy removes the whole subtree and clears every ObjectRef pointing
*               into it. Used by the unit tests and by embedders without a host of their own.
*********************************************************************************/
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "Hierarchy/IObjectModel.hpp"

namespace Serial {

    class SERIAL_API MemoryObjectModel : public IObjectModel {
    public:
        // Registers (or replaces) a class. Properties of superclass are inherited; entries in
        // defaults override inherited ones.
        void DefineClass(const std::string& className, const std::string& superclass,
                         const std::map<std::string, Value>& defaults);

        // Reads of this property throw HostError on every object of the class.
        void MarkUnreadable(const std::string& className, const std::string& property);

        bool HasClass(const std::string& className) const { return classes.count(className) != 0; }
        size_t ObjectCount() const { return objects.size(); }

        // Number of Create calls so far, including objects already destroyed.
        size_t CreatedCount() const { return createdCount; }

        ObjectHandle Create(const std::string& className) override;
        void Destroy(ObjectHandle object) override;
        bool IsValid(ObjectHandle object) const override;
        std::string GetClassName(ObjectHandle object) const override;

        Value GetProperty(ObjectHandle object, const std::string& name) const override;
        void SetProperty(ObjectHandle object, const std::string& name, const Value& value) override;

        ObjectHandle GetParent(ObjectHandle object) const override;
        void SetParent(ObjectHandle object, ObjectHandle parent) override;
        std::vector<ObjectHandle> GetChildren(ObjectHandle object) const override;

        std::vector<std::string> GetTags(ObjectHandle object) const override;
        void AddTag(ObjectHandle object, const std::string& tag) override;

        std::map<std::string, Value> GetAttributes(ObjectHandle object) const override;
        void SetAttribute(ObjectHandle object, const std::string& name, const Value& value) override;

    private:
        struct ClassPrototype {
            std::string superclass;
            std::map<std::string, Value> defaults;
            std::set<std::string> unreadable;
        };

        struct Object {
            std::string className;
            std::map<std::string, Value> properties;
            ObjectHandle parent = NullObject;
            std::vector<ObjectHandle> children;
            std::vector<std::string> tags;
            std::map<std::string, Value> attributes;
        };

        Object& Require(ObjectHandle object);
        const Object& Require(ObjectHandle object) const;

        // Walks the superclass chain, base first.
        std::vector<const ClassPrototype*> GetChain(const std::string& className) const;
        bool IsUnreadable(const std::string& className, const std::string& property) const;

        void Detach(ObjectHandle object, Object& obj);
        void CollectSubtree(ObjectHandle object, std::vector<ObjectHandle>& out) const;

        std::unordered_map<std::string, ClassPrototype> classes;
        std::unordered_map<ObjectHandle, Object> objects;
        ObjectHandle nextHandle = 1;
        size_t createdCount = 0;
    };

} // namespace Serial
