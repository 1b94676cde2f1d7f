#pragma once

#include <map>
#include <string>
#include <vector>

#include "Serial.h"
#include "Values/Value.hpp"

namespace Serial {

/**
 * @brief Host object model the serializer reads from and writes into
 *
 * Objects are addressed by ObjectHandle (never 0 for a live object). Properties
 * holding other objects use ObjectRef values. Hosts report refusals by throwing
 * HostError; the serializer turns those into HostFailure diagnostics where it can
 * continue, and lets them propagate where it cannot.
 *
 * SchemaRegistry::ResolveDefaults holds the registry's defaults lock while it calls
 * Create, GetProperty and Destroy (and while it reports diagnostics). Implementations
 * must not call back into the same SchemaRegistry or an InstanceSerializer using it
 * from those methods; doing so deadlocks.
 *
 * @example
 * ObjectHandle part = model.Create("Part");
 * model.SetProperty(part, "Anchored", true);
 * model.SetParent(part, workspace);
 */
class SERIAL_API IObjectModel {
public:
    virtual ~IObjectModel() = default;

    // ========== Lifetime ==========

    /**
     * @brief Create a detached object of the given class
     * @throws HostError when the class cannot be created
     */
    virtual ObjectHandle Create(const std::string& className) = 0;

    /**
     * @brief Destroy an object and its whole subtree
     */
    virtual void Destroy(ObjectHandle object) = 0;

    virtual bool IsValid(ObjectHandle object) const = 0;

    virtual std::string GetClassName(ObjectHandle object) const = 0;

    // ========== Properties ==========

    /**
     * @brief Read a property
     * @return The current value; ObjectRef for object-valued properties
     * @throws HostError when the property does not exist or cannot be read
     */
    virtual Value GetProperty(ObjectHandle object, const std::string& name) const = 0;

    /**
     * @brief Write a property
     * @throws HostError when the property does not exist or rejects the value
     */
    virtual void SetProperty(ObjectHandle object, const std::string& name, const Value& value) = 0;

    // ========== Hierarchy ==========

    virtual ObjectHandle GetParent(ObjectHandle object) const = 0;

    /**
     * @brief Move an object under a new parent (NullObject detaches it)
     *
     * The object is appended after the parent's existing children.
     */
    virtual void SetParent(ObjectHandle object, ObjectHandle parent) = 0;

    virtual std::vector<ObjectHandle> GetChildren(ObjectHandle object) const = 0;

    // ========== Tags & Attributes ==========

    virtual std::vector<std::string> GetTags(ObjectHandle object) const = 0;
    virtual void AddTag(ObjectHandle object, const std::string& tag) = 0;

    // Attributes in name order
    virtual std::map<std::string, Value> GetAttributes(ObjectHandle object) const = 0;
    virtual void SetAttribute(ObjectHandle object, const std::string& name, const Value& value) = 0;
};

} // namespace Serial
