#include "pch.h"
#include "Hierarchy/MemoryObjectModel.hpp"
#include "SerialError.hpp"

namespace Serial {

    void MemoryObjectModel::DefineClass(const std::string& className, const std::string& superclass,
                                        const std::map<std::string, Value>& defaults)
    {
        ClassPrototype& proto = classes[className];
        proto.superclass = superclass;
        proto.defaults = defaults;
    }

    void MemoryObjectModel::MarkUnreadable(const std::string& className, const std::string& property)
    {
        auto it = classes.find(className);
        if (it == classes.end()) throw HostError("MarkUnreadable: unknown class " + className);
        it->second.unreadable.insert(property);
    }

    std::vector<const MemoryObjectModel::ClassPrototype*> MemoryObjectModel::GetChain(const std::string& className) const
    {
        std::vector<const ClassPrototype*> chain;
        std::set<std::string> seen;

        std::string current = className;
        while (!current.empty() && seen.insert(current).second) {
            auto it = classes.find(current);
            if (it == classes.end()) break;
            chain.push_back(&it->second);
            current = it->second.superclass;
        }
        std::reverse(chain.begin(), chain.end());
        return chain;
    }

    bool MemoryObjectModel::IsUnreadable(const std::string& className, const std::string& property) const
    {
        for (const ClassPrototype* proto : GetChain(className)) {
            if (proto->unreadable.count(property)) return true;
        }
        return false;
    }

    MemoryObjectModel::Object& MemoryObjectModel::Require(ObjectHandle object)
    {
        auto it = objects.find(object);
        if (it == objects.end()) throw HostError("Invalid object handle " + std::to_string(object));
        return it->second;
    }

    const MemoryObjectModel::Object& MemoryObjectModel::Require(ObjectHandle object) const
    {
        auto it = objects.find(object);
        if (it == objects.end()) throw HostError("Invalid object handle " + std::to_string(object));
        return it->second;
    }

    ObjectHandle MemoryObjectModel::Create(const std::string& className)
    {
        if (!HasClass(className)) throw HostError("Unable to create an object of unknown class " + className);

        Object obj;
        obj.className = className;
        for (const ClassPrototype* proto : GetChain(className)) {
            for (const auto& [name, value] : proto->defaults) obj.properties[name] = value;
        }

        ObjectHandle handle = nextHandle++;
        objects.emplace(handle, std::move(obj));
        ++createdCount;
        return handle;
    }

    void MemoryObjectModel::CollectSubtree(ObjectHandle object, std::vector<ObjectHandle>& out) const
    {
        out.push_back(object);
        for (ObjectHandle child : Require(object).children) CollectSubtree(child, out);
    }

    void MemoryObjectModel::Detach(ObjectHandle object, Object& obj)
    {
        if (obj.parent == NullObject) return;

        auto parent = objects.find(obj.parent);
        if (parent != objects.end()) {
            auto& siblings = parent->second.children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), object), siblings.end());
        }
        obj.parent = NullObject;
    }

    void MemoryObjectModel::Destroy(ObjectHandle object)
    {
        Object& obj = Require(object);
        Detach(object, obj);

        std::vector<ObjectHandle> doomed;
        CollectSubtree(object, doomed);
        std::unordered_set<ObjectHandle> doomedSet(doomed.begin(), doomed.end());

        for (ObjectHandle handle : doomed) objects.erase(handle);

        // Survivors must not keep references into the destroyed subtree
        for (auto& entry : objects) {
            for (auto& prop : entry.second.properties) {
                auto ref = std::get_if<ObjectRef>(&prop.second);
                if (ref && doomedSet.count(ref->handle)) ref->handle = NullObject;
            }
        }
    }

    bool MemoryObjectModel::IsValid(ObjectHandle object) const
    {
        return objects.count(object) != 0;
    }

    std::string MemoryObjectModel::GetClassName(ObjectHandle object) const
    {
        return Require(object).className;
    }

    Value MemoryObjectModel::GetProperty(ObjectHandle object, const std::string& name) const
    {
        const Object& obj = Require(object);
        auto it = obj.properties.find(name);
        if (it == obj.properties.end()) throw HostError(name + " is not a valid member of " + obj.className);
        if (IsUnreadable(obj.className, name)) throw HostError(name + " of " + obj.className + " cannot be read");
        return it->second;
    }

    void MemoryObjectModel::SetProperty(ObjectHandle object, const std::string& name, const Value& value)
    {
        Object& obj = Require(object);
        auto it = obj.properties.find(name);
        if (it == obj.properties.end()) throw HostError(name + " is not a valid member of " + obj.className);

        if (auto ref = std::get_if<ObjectRef>(&value)) {
            if (ref->handle != NullObject && !IsValid(ref->handle))
                throw HostError("Cannot assign a destroyed object to " + obj.className + "." + name);
        }
        it->second = value;
    }

    ObjectHandle MemoryObjectModel::GetParent(ObjectHandle object) const
    {
        return Require(object).parent;
    }

    void MemoryObjectModel::SetParent(ObjectHandle object, ObjectHandle parent)
    {
        Object& obj = Require(object);
        if (obj.parent == parent) return;

        if (parent != NullObject) {
            Require(parent);
            for (ObjectHandle p = parent; p != NullObject; p = Require(p).parent) {
                if (p == object) throw HostError("Setting parent would create a cycle");
            }
        }

        Detach(object, obj);
        if (parent != NullObject) {
            Require(parent).children.push_back(object);
            obj.parent = parent;
        }
    }

    std::vector<ObjectHandle> MemoryObjectModel::GetChildren(ObjectHandle object) const
    {
        return Require(object).children;
    }

    std::vector<std::string> MemoryObjectModel::GetTags(ObjectHandle object) const
    {
        return Require(object).tags;
    }

    void MemoryObjectModel::AddTag(ObjectHandle object, const std::string& tag)
    {
        auto& tags = Require(object).tags;
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(tag);
    }

    std::map<std::string, Value> MemoryObjectModel::GetAttributes(ObjectHandle object) const
    {
        return Require(object).attributes;
    }

    void MemoryObjectModel::SetAttribute(ObjectHandle object, const std::string& name, const Value& value)
    {
        auto& attributes = Require(object).attributes;
        if (IsNull(value)) attributes.erase(name);
        else attributes[name] = value;
    }

} // namespace Serial
