// SPDX-License-Identifier: Apache-2.0

#include "Callsite.hpp"
#include "Collection.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "Model.hpp"
#include "Registry.hpp"
#include "Relationship.hpp"
#include "Repository.hpp"
#include "Resource.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <ranges>

namespace Quarry
{

Resource::Resource(PrivateTag, Model const& model):
    _model { &model }
{
}

ResourcePtr Resource::Make(Model const& model, AttributeMap const& attributes)
{
    auto resource = std::make_shared<Resource>(PrivateTag {}, model);
    resource->SetAttributes(attributes);
    return resource;
}

Lazy<Value>& Resource::Slot(Property const& property)
{
    auto const index = property.Index();
    if (_attributes.size() <= index)
        _attributes.resize(index + 1);
    return _attributes[index];
}

Lazy<Value> const* Resource::FindSlot(Property const& property) const noexcept
{
    auto const index = property.Index();
    return index < _attributes.size() ? &_attributes[index] : nullptr;
}

ResourcePtr Resource::Self()
{
    if (auto self = weak_from_this().lock(); self)
        return self;

    throw UnmanagedResourceError(std::format("{} is not owned by a std::shared_ptr", _model->Name()));
}

// {{{ attributes

Value const& Resource::Get(std::string_view name)
{
    return _model->GetProperty(name).Get(*this);
}

void Resource::Set(std::string_view name, Value value)
{
    _model->GetProperty(name).Set(*this, std::move(value));
}

AttributeMap Resource::Attributes()
{
    AttributeMap result;
    for (auto const* property: _model->Properties().All())
        if (property->IsReaderPublic())
            result.emplace_back(property->Name(), property->Get(*this));
    return result;
}

void Resource::SetAttributes(AttributeMap const& attributes)
{
    std::vector<Property const*> properties;
    properties.reserve(attributes.size());

    for (auto const& [name, value]: attributes)
    {
        auto const* property = _model->FindProperty(name);
        if (!property)
            throw ArgumentError(ErrorCode::UNKNOWN_PROPERTY, std::format("Unknown attribute {}.{}", _model->Name(), name));
        if (!property->IsWriterPublic())
            throw ArgumentError(ErrorCode::INACCESSIBLE_PROPERTY,
                                std::format("Attribute {}.{} is not publicly writable", _model->Name(), name));
        properties.push_back(property);
    }

    for (auto const [property, attribute]: std::views::zip(properties, attributes))
        property->Set(*this, attribute.second);
}

bool Resource::IsDirty() const
{
    if (!_originalValues.empty())
        return true;

    if (!IsNew())
        return false;

    if (_model->IdentityField())
        return true;

    return std::ranges::any_of(_model->Properties().All(), [](Property const* property) { return property->HasDefault(); });
}

bool Resource::IsAttributeDirty(std::string_view name) const
{
    return _originalValues.contains(&_model->GetProperty(name));
}

bool Resource::IsAttributeLoaded(std::string_view name) const
{
    return _model->GetProperty(name).IsLoaded(*this);
}

std::vector<Property const*> Resource::LoadedAttributes() const
{
    std::vector<Property const*> result;
    for (auto const* property: _model->Properties().All())
        if (property->IsLoaded(*this))
            result.push_back(property);
    return result;
}

std::vector<PropertyValue> Resource::OriginalValues() const
{
    std::vector<PropertyValue> result;
    for (auto const& [property, value]: _originalValues)
        result.emplace_back(PropertyValue { .property = property, .value = value });
    std::ranges::sort(result, std::less {}, [](PropertyValue const& entry) { return entry.property->Index(); });
    return result;
}

PropertyValueList Resource::DirtyAttributes() const
{
    PropertyValueList result;
    for (auto const& [property, original]: _originalValues)
        result.emplace_back(PropertyValue { .property = property, .value = property->GetLoaded(*this) });
    std::ranges::sort(result, std::less {}, [](PropertyValue const& entry) { return entry.property->Index(); });
    return result;
}

std::optional<Key> Resource::GetKey() const
{
    if (auto const* key = _key.Get(); key)
        return *key;

    auto const keyProperties = _model->Key();
    if (keyProperties.empty())
        return std::nullopt;

    Key key;
    for (auto const* property: keyProperties)
    {
        auto const original = _originalValues.find(property);
        auto const& value = original != _originalValues.end() && !original->second.IsNull()
                                ? original->second
                                : property->GetLoaded(*this);
        if (value.IsNull())
            return std::nullopt;
        key.push_back(value);
    }

    return _key.Emplace(std::move(key));
}

// }}}

// {{{ lifecycle

std::shared_ptr<Repository> Resource::GetRepository() const
{
    if (_repository)
        return _repository;
    return _model->DefaultRepository();
}

Query Resource::ToQuery() const
{
    if (auto const key = GetKey(); key)
        return Query::ForKey(GetRepository(), *_model, *key);

    Key key;
    for (auto const* property: _model->Key())
        key.push_back(property->GetLoaded(*this));
    return Query::ForKey(GetRepository(), *_model, key);
}

bool Resource::Create()
{
    if (!IsNew() || !IsDirty())
        return false;

    auto self = Self();

    for (auto const* property: _model->Properties().All())
        if (!property->IsSerial() && !property->IsLoaded(*this))
            property->Set(*this, property->DefaultFor(*this));

    auto repository = GetRepository();
    if (repository->Create({ self }) != 1)
        return false;

    _repository = repository;
    _saved = true;
    _originalValues.clear();
    _key.Reset();

    if (auto const key = GetKey(); key)
        repository->IdentityMapFor(*_model).Set(*key, self);

    return true;
}

bool Resource::Update()
{
    if (IsNew())
        return false;

    auto const dirty = DirtyAttributes();
    if (dirty.empty())
        return true;

    for (auto const& [property, value]: dirty)
        if (!property->IsNullable() && value.IsNull())
            return false;

    auto repository = GetRepository();
    auto const oldKey = GetKey();
    if (repository->Update(dirty, ToQuery()) != 1)
        return false;

    _originalValues.clear();
    _key.Reset();

    if (auto const newKey = GetKey(); newKey)
    {
        auto& identityMap = repository->IdentityMapFor(*_model);
        if (oldKey && *oldKey != *newKey)
            identityMap.EraseIfSame(*oldKey, *this);
        identityMap.Set(*newKey, Self());
    }

    return true;
}

bool Resource::Update(AttributeMap const& attributes)
{
    SetAttributes(attributes);
    return Update();
}

bool Resource::Save()
{
    SyncParentKeys();

    if (!(IsNew() ? Create() : Update()))
        return false;

    return SaveChildren();
}

bool Resource::Destroy()
{
    if (IsNew())
        return false;

    if (GetRepository()->Delete(ToQuery()) != 1)
        return false;

    Reset();
    return true;
}

void Resource::Reset()
{
    if (_saved && _repository)
        if (auto const key = GetKey(); key)
            _repository->IdentityMapFor(*_model).EraseIfSame(*key, *this);

    _saved = false;
    _originalValues.clear();
    _key.Reset();
}

Resource& Resource::Reload()
{
    if (IsNew())
        return *this;

    std::vector<std::string> fields;
    for (auto const* property: LoadedAttributes())
        fields.push_back(property->Name());

    auto collection = _collection.lock();
    if (!collection)
        collection = Collection::Make(ToQuery(), { Self() });

    collection->Reload(fields, Collection::RefreshMode::Overwrite);
    ReloadChildren();
    return *this;
}

void Resource::LazyLoad(Property const& property)
{
    if (IsNew())
        return;

    std::vector<Property const*> context;
    for (auto const* candidate: _model->Properties().LazyLoadContext(property))
        if (!candidate->IsLoaded(*this))
            context.push_back(candidate);
    if (std::ranges::find(context, &property) == context.end() && !property.IsLoaded(*this))
        context.push_back(&property);

    if (context.empty())
        return;

    Logger::GetLogger().OnLazyLoad(*this, context);

    std::vector<std::string> fields;
    for (auto const* candidate: context)
        fields.push_back(candidate->Name());

    auto collection = _collection.lock();
    if (!collection)
        collection = Collection::Make(ToQuery(), { Self() });
    collection->Reload(fields, Collection::RefreshMode::FillUnloaded);

    // Attributes the store did not return are known to be null from now on.
    for (auto const* candidate: context)
        if (!candidate->IsLoaded(*this))
            candidate->Load(*this, Value {});

    if (_callsite && _callsite->GetModel().FindProperty(property.Name()))
        _callsite->TrackField(property.Name());
}

void Resource::OnLoaded(std::shared_ptr<Repository> repository,
                        std::shared_ptr<Collection> const& collection,
                        std::shared_ptr<Callsite> const& callsite)
{
    _saved = true;
    _repository = std::move(repository);
    if (collection)
        _collection = collection;
    if (callsite && !_callsite)
        _callsite = callsite;
}

// }}}

// {{{ comparison

std::string Resource::Inspect() const
{
    std::string result = std::format("#<{}", _model->Name());
    for (auto const* property: _model->Properties().All())
    {
        if (property->IsLoaded(*this))
            result += std::format(" {}={}", property->Name(), property->GetLoaded(*this).Inspect());
        else if (_saved)
            result += std::format(" {}=<not loaded>", property->Name());
        else
            result += std::format(" {}={}", property->Name(), Value {}.Inspect());
    }
    result += '>';
    return result;
}

bool Resource::Eql(Resource const& other) const
{
    if (this == &other)
        return true;

    if (_model != other._model)
        return false;

    return CompareAttributes(other, true);
}

bool Resource::operator==(Resource const& other) const
{
    if (this == &other)
        return true;

    if (&_model->BaseModel() != &other._model->BaseModel())
        return false;

    return CompareAttributes(other, false);
}

bool Resource::CompareAttributes(Resource const& other, bool strict) const
{
    auto const equal = [strict](Value const& a, Value const& b) {
        return strict ? a == b : a.Equivalent(b);
    };

    auto const key = GetKey();
    auto const otherKey = other.GetKey();
    if (key && otherKey)
    {
        if (!std::ranges::equal(*key, *otherKey, equal))
            return false;

        if (!IsDirty() && !other.IsDirty() && GetRepository() == other.GetRepository())
            return true;
    }

    // Compare what is loaded on both sides first, and only then load what is missing.
    std::vector<std::pair<Property const*, Property const*>> unloaded;
    for (auto const* property: _model->Properties().All())
    {
        auto const* otherProperty = other._model->FindProperty(property->Name());
        if (!otherProperty)
            return false;

        if (property->IsLoaded(*this) && otherProperty->IsLoaded(other))
        {
            if (!equal(property->GetLoaded(*this), otherProperty->GetLoaded(other)))
                return false;
        }
        else
            unloaded.emplace_back(property, otherProperty);
    }

    for (auto const& [property, otherProperty]: unloaded)
    {
        auto const value = property->Get(const_cast<Resource&>(*this));
        auto const otherValue = otherProperty->Get(const_cast<Resource&>(other));
        if (!equal(value, otherValue))
            return false;
    }

    return true;
}

std::weak_ordering Resource::operator<=>(Resource const& other) const
{
    if (!other._model->IsA(*_model))
        throw IncompatibleModelError(
            std::format("Cannot compare a {} with a {}", _model->Name(), other._model->Name()));

    for (auto const& [name, direction]: _model->DefaultOrder())
    {
        auto const& property = _model->GetProperty(name);
        auto const ordering = property.GetLoaded(*this).Compare(property.GetLoaded(other));
        if (ordering != 0)
            return direction == SortDirection::Descending ? 0 <=> ordering : ordering;
    }

    return std::weak_ordering::equivalent;
}

std::size_t Resource::Hash() const
{
    auto const modelHash = std::hash<std::string> {}(_model->BaseModel().Name());
    auto const keyHash = KeyHash {}(GetKey().value_or(Key {}));
    return modelHash ^ (keyHash + 0x9e3779b97f4a7c15ULL + (modelHash << 6) + (modelHash >> 2));
}

// }}}

// {{{ associations

Relationship const& Resource::RequireRelationship(std::string_view name) const
{
    auto const& repositoryName = _repository ? _repository->Name() : _model->DefaultRepositoryName();
    return _model->GetRelationship(name, repositoryName);
}

Resource::Association& Resource::AssociationFor(Relationship const& relationship)
{
    auto& association = _associations[relationship.Name()];
    if (association.relationship.get() != &relationship)
        association.relationship = relationship.shared_from_this();
    return association;
}

void Resource::TrackLink(Relationship const& relationship)
{
    if (_callsite && _callsite->GetModel().Relationships(_callsite->RepositoryName()).Contains(relationship.Name()))
        _callsite->TrackLink(relationship.Name());
}

ResourcePtr Resource::GetOne(std::string_view relationshipName)
{
    auto const& relationship = RequireRelationship(relationshipName);
    if (relationship.IsToMany())
        throw ArgumentError(ErrorCode::UNKNOWN_RELATIONSHIP,
                            std::format("{}.{} is not a to-one relationship", _model->Name(), relationshipName));

    auto& association = AssociationFor(relationship);
    TrackLink(relationship);

    if (relationship.Kind() == RelationshipKind::ManyToOne)
        return LoadParent(relationship, association);

    if (auto const* child = association.child.Get(); child)
        return *child;

    if (association.child.IsNil() || IsNew() || !GetKey())
        return nullptr;

    auto child = Collection::Load(relationship.TargetQuery(*this))->First();
    if (child)
        association.child.Emplace(child);
    else
        association.child.EmplaceNil();
    return child;
}

ResourcePtr Resource::LoadParent(Relationship const& relationship, Association& association)
{
    auto const childKey = relationship.ChildKey();
    for (auto const& name: childKey)
        (void) Get(name);

    if (association.assignedParent)
        return association.assignedParent;

    auto const foreignKey = relationship.ForeignKeyOf(*this);

    if (auto parent = association.parent.lock(); parent)
    {
        Key referencedKey;
        for (auto const& name: relationship.ParentKey())
            referencedKey.push_back(parent->GetModel().GetProperty(name).GetLoaded(*parent));

        if (parent->IsNew() || (foreignKey && *foreignKey == referencedKey))
            return parent;
    }

    if (!foreignKey)
        return nullptr;

    auto const& parentModel = relationship.TargetModel();
    auto repository = _model->GetRegistry().GetRepository(relationship.ParentRepositoryName());

    ResourcePtr parent;

    std::vector<std::string> modelKey;
    for (auto const* property: parentModel.Key())
        modelKey.push_back(property->Name());
    if (modelKey == relationship.ParentKey())
        parent = repository->IdentityMapFor(parentModel).Get(*foreignKey);

    if (!parent)
        parent = Collection::Load(relationship.TargetQuery(*this))->First();

    association.parent = parent;
    return parent;
}

std::shared_ptr<Collection> Resource::GetMany(std::string_view relationshipName)
{
    auto const& relationship = RequireRelationship(relationshipName);
    if (!relationship.IsToMany())
        throw ArgumentError(ErrorCode::UNKNOWN_RELATIONSHIP,
                            std::format("{}.{} is not a to-many relationship", _model->Name(), relationshipName));

    auto& association = AssociationFor(relationship);
    TrackLink(relationship);

    if (!association.many)
        association.many = Collection::ForRelationship(relationship, Self());
    return association.many;
}

void Resource::SetOne(std::string_view relationshipName, ResourcePtr target)
{
    auto const& relationship = RequireRelationship(relationshipName);
    if (relationship.IsToMany())
        throw ArgumentError(ErrorCode::UNKNOWN_RELATIONSHIP,
                            std::format("{}.{} is not a to-one relationship", _model->Name(), relationshipName));

    auto& association = AssociationFor(relationship);

    if (relationship.Kind() == RelationshipKind::ManyToOne)
    {
        association.parent = target;
        association.assignedParent = target;
        if (!target)
        {
            for (auto const& name: relationship.ChildKey())
                Set(name, Value {});
        }
        else if (target->GetKey())
        {
            relationship.AssignChildKey(*this, *target);
            association.assignedParent.reset();
        }
        return;
    }

    if (target)
    {
        if (GetKey())
            relationship.AssignChildKey(*target, *this);
        association.child.Emplace(std::move(target));
    }
    else
        association.child.EmplaceNil();
}

void Resource::SyncParentKeys()
{
    for (auto& [name, association]: _associations)
    {
        if (association.relationship->Kind() != RelationshipKind::ManyToOne)
            continue;

        auto const parent = association.assignedParent ? association.assignedParent : association.parent.lock();
        if (parent && parent->GetKey())
        {
            association.relationship->AssignChildKey(*this, *parent);
            association.assignedParent.reset();
        }
    }
}

bool Resource::SaveChildren()
{
    for (auto const* relationship: _model->Relationships(GetRepository()->Name()).All())
    {
        auto const i = _associations.find(relationship->Name());
        if (i == _associations.end())
            continue;

        auto const& association = i->second;
        switch (association.relationship->Kind())
        {
            case RelationshipKind::ManyToOne:
                break;
            case RelationshipKind::OneToOne:
                if (auto const* child = association.child.Get(); child)
                {
                    association.relationship->AssignChildKey(**child, *this);
                    if (!(*child)->Save())
                        return false;
                }
                break;
            case RelationshipKind::OneToMany:
            case RelationshipKind::ManyToMany:
                if (association.many && !association.many->Save())
                    return false;
                break;
        }
    }
    return true;
}

void Resource::ReloadChildren()
{
    for (auto const& [name, association]: _associations)
    {
        switch (association.relationship->Kind())
        {
            case RelationshipKind::ManyToOne:
                break;
            case RelationshipKind::OneToOne:
                if (auto const* child = association.child.Get(); child)
                    (*child)->Reload();
                break;
            case RelationshipKind::OneToMany:
            case RelationshipKind::ManyToMany:
                if (association.many)
                    association.many->ReloadAll();
                break;
        }
    }
}

// }}}

} // namespace Quarry
