// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Quarry/Resource.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <unordered_set>

using namespace Quarry;

namespace
{

Model& DefineNote(Registry& registry)
{
    auto& note = registry.DefineModel("Note");
    note.DeclareProperty("code", PropertyType::String, PropertyOptions { .nullable = false, .key = true });
    note.DeclareProperty("text", PropertyType::Text);
    return note;
}

} // namespace

TEST_CASE_METHOD(QuarryTestFixture, "Resource.NewIsNotDirty", "[Resource]")
{
    auto& note = DefineNote(registry);

    auto const resource = note.New();
    CHECK(resource->IsNew());
    CHECK(!resource->IsDirty());
    CHECK(!resource->GetKey().has_value());

    CHECK(!resource->Save());
    CHECK(resource->IsNew());
    CHECK(repository->counters.creates == 0);
    CHECK(repository->IdentityMapFor(note).Size() == 0);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.NewWithIdentityIsDirty", "[Resource]")
{
    auto& product = DefineProduct();
    CHECK(product.New()->IsDirty());
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Create", "[Resource]")
{
    auto& product = DefineProduct();

    auto const resource = product.New({ { "name", "Hammer" } });
    CHECK(resource->IsAttributeDirty("name"));
    REQUIRE(resource->Save());

    CHECK(resource->IsSaved());
    CHECK(!resource->IsDirty());
    CHECK(resource->OriginalValues().empty());
    REQUIRE(resource->GetKey() == Key { 1 });

    // Default values are assigned on creation.
    CHECK(resource->Get("type") == Value { "Product" });

    auto const& identityMap = repository->IdentityMapFor(product);
    CHECK(identityMap.Get(Key { 1 }) == resource);

    // Creating twice is refused.
    CHECK(!resource->Create());
    CHECK(repository->TableOf(product).size() == 1);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.CreateLoadsUnsetAttributes", "[Resource]")
{
    auto& product = DefineProduct();

    auto const resource = product.New({ { "name", "Hammer" } });
    REQUIRE(resource->Save());

    // Attributes left unset are stored as null and need not be read back.
    auto const reads = repository->counters.reads;
    CHECK(resource->IsAttributeLoaded("active"));
    CHECK(resource->Get("active").IsNull());
    CHECK(resource->Get("category_id").IsNull());
    CHECK(repository->counters.reads == reads);
    CHECK(resource->Inspect() == R"(#<Product id=1 type="Product" name="Hammer" category_id=NULL active=NULL>)");
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.CreateFailure", "[Resource]")
{
    auto& product = DefineProduct();
    repository->failing = RepositoryOperation::Create;

    auto const resource = product.New({ { "name", "Hammer" } });
    CHECK(!resource->Save());
    CHECK(resource->IsNew());
    CHECK(repository->IdentityMapFor(product).Size() == 0);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Update", "[Resource]")
{
    auto& product = DefineProduct();
    auto const resource = product.New({ { "name", "Hammer" } });
    REQUIRE(resource->Save());

    SECTION("nothing dirty")
    {
        CHECK(resource->Update());
        CHECK(repository->counters.updates == 0);
    }

    SECTION("dirty attribute")
    {
        resource->Set("name", "Mallet");
        CHECK(resource->IsDirty());
        auto const dirty = resource->DirtyAttributes();
        REQUIRE(dirty.size() == 1);
        CHECK(dirty.front().property->Name() == "name");
        CHECK(dirty.front().value == Value { "Mallet" });

        REQUIRE(resource->Update());
        CHECK(!resource->IsDirty());
        CHECK(repository->TableOf(product).front().at("name") == Value { "Mallet" });
    }

    SECTION("reverting a change")
    {
        resource->Set("name", "Mallet");
        resource->Set("name", "Hammer");
        CHECK(!resource->IsDirty());
    }

    SECTION("null in a non-nullable attribute")
    {
        resource->Set("name", nullptr);
        CHECK(!resource->Update());
        CHECK(repository->counters.updates == 0);
        CHECK(!resource->OriginalValues().empty());
        CHECK(resource->IsDirty());
        CHECK(repository->TableOf(product).front().at("name") == Value { "Hammer" });
    }

    SECTION("mass assignment")
    {
        REQUIRE(resource->Update({ { "name", "Mallet" }, { "active", true } }));
        CHECK(repository->TableOf(product).front().at("active") == Value { true });
    }

    SECTION("repository refuses")
    {
        repository->failing = RepositoryOperation::Update;
        resource->Set("name", "Mallet");
        CHECK(!resource->Update());
        CHECK(resource->IsDirty());
    }
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.UpdateChangingTheKey", "[Resource][IdentityMap]")
{
    auto& note = DefineNote(registry);
    auto const resource = note.New({ { "code", "A" }, { "text", "first" } });
    REQUIRE(resource->Save());

    auto& identityMap = repository->IdentityMapFor(note);
    REQUIRE(identityMap.Get(Key { "A" }) == resource);

    resource->Set("code", "B");
    // The key keeps identifying the persisted row until the change is saved.
    CHECK(resource->GetKey() == Key { "A" });

    REQUIRE(resource->Save());
    CHECK(resource->GetKey() == Key { "B" });
    CHECK(identityMap.Get(Key { "B" }) == resource);
    CHECK(identityMap.Get(Key { "A" }) == nullptr);
    CHECK(repository->TableOf(note).front().at("code") == Value { "B" });
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Destroy", "[Resource]")
{
    auto& product = DefineProduct();
    auto const resource = product.New({ { "name", "Hammer" } });

    CHECK(!resource->Destroy());

    REQUIRE(resource->Save());
    REQUIRE(resource->Destroy());
    CHECK(!resource->IsSaved());
    CHECK(repository->IdentityMapFor(product).Get(Key { 1 }) == nullptr);
    CHECK(repository->TableOf(product).empty());

    // Destroyed resources become new again and can be recreated.
    CHECK(resource->IsNew());
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.DestroyFailure", "[Resource]")
{
    auto& product = DefineProduct();
    auto const resource = product.New({ { "name", "Hammer" } });
    REQUIRE(resource->Save());

    repository->failing = RepositoryOperation::Delete;
    CHECK(!resource->Destroy());
    CHECK(resource->IsSaved());
    CHECK(repository->IdentityMapFor(product).Get(Key { 1 }) == resource);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Get", "[Resource]")
{
    auto& product = DefineProduct();
    repository->Insert(product, Row { { "id", 1 }, { "type", "Product" }, { "name", "Hammer" } });

    auto const hammer = product.Get(Key { 1 });
    REQUIRE(hammer);
    CHECK(hammer->IsSaved());
    CHECK(hammer->Get("name") == Value { "Hammer" });

    // Served from the identity map while the resource is alive.
    auto const reads = repository->counters.reads;
    CHECK(product.Get(Key { 1 }) == hammer);
    CHECK(repository->counters.reads == reads);

    CHECK(product.Get(Key { 2 }) == nullptr);
    CHECK(ThrownErrorCode([&] { (void) product.Get(Key { 1, 2 }); }) == ErrorCode::UNKNOWN_PROPERTY);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.EqualityWithoutLoading", "[Resource]")
{
    auto& product = DefineProduct();
    repository->Insert(product, Row { { "id", 1 }, { "type", "Product" }, { "name", "Hammer" } });

    auto const a = product.Get(Key { 1 });
    REQUIRE(a);
    REQUIRE(repository->IdentityMapFor(product).Erase(Key { 1 }));
    auto const b = product.Get(Key { 1 });
    REQUIRE(b);
    REQUIRE(a != b);

    auto const reads = repository->counters.reads;
    CHECK(*a == *b);
    CHECK(a->Eql(*b));
    CHECK(repository->counters.reads == reads);
    CHECK(!a->IsAttributeLoaded("name"));
    CHECK(std::hash<Resource> {}(*a) == std::hash<Resource> {}(*b));
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.EqualityOfNewResources", "[Resource]")
{
    auto& product = DefineProduct();

    auto const a = product.New({ { "name", "Hammer" }, { "category_id", 1 } });
    auto const b = product.New({ { "name", "Hammer" }, { "category_id", 1.0 } });
    auto const c = product.New({ { "name", "Saw" } });

    CHECK(*a == *b);
    CHECK(*a != *c);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Ordering", "[Resource]")
{
    auto& product = DefineProduct();
    auto& book = product.Inherit("Book");
    auto& note = registry.DefineModel("Note");
    note.DeclareProperty("code", PropertyType::String, PropertyOptions { .key = true });

    auto const hammer = product.New({ { "id", 1 }, { "name", "Hammer" } });
    auto const saw = product.New({ { "id", 2 }, { "name", "Saw" } });
    auto const novel = book.New({ { "id", 3 }, { "name", "Novel" } });
    auto const memo = note.New({ { "code", "x" } });

    CHECK(*hammer < *saw);
    CHECK(*saw > *hammer);
    CHECK(*hammer < *novel);

    CHECK_THROWS_AS((void) (*hammer < *memo), IncompatibleModelError);
    CHECK_THROWS_AS((void) (*novel < *hammer), IncompatibleModelError);

    product.SetDefaultOrder({ OrderBy { .property = "name", .direction = SortDirection::Descending } });
    CHECK(*saw < *hammer);
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Attributes", "[Resource]")
{
    auto& account = registry.DefineModel("Account");
    account.DeclareProperty("id", PropertyType::Integer, PropertyOptions { .serial = true });
    account.DeclareProperty("login", PropertyType::String);
    account.DeclareProperty("password", PropertyType::String, PropertyOptions { .reader = Visibility::Private });
    account.DeclareProperty("role", PropertyType::String, PropertyOptions { .defaultValue = Value { "user" }, .writer = Visibility::Private });

    auto const resource = account.New({ { "login", "alice" } });

    auto const attributes = resource->Attributes();
    REQUIRE(attributes.size() == 3);
    CHECK(attributes[1] == std::pair<std::string, Value> { "login", "alice" });
    CHECK(attributes[2] == std::pair<std::string, Value> { "role", "user" });

    CHECK(ThrownErrorCode([&] { resource->SetAttributes({ { "login", "bob" }, { "role", "admin" } }); })
          == ErrorCode::INACCESSIBLE_PROPERTY);
    CHECK(ThrownErrorCode([&] { resource->SetAttributes({ { "login", "bob" }, { "email", "x" } }); })
          == ErrorCode::UNKNOWN_PROPERTY);

    // Nothing is assigned when any attribute is refused.
    CHECK(resource->Get("login") == Value { "alice" });

    // Internal writes bypass the visibility rules.
    resource->Set("password", "secret");
    CHECK(resource->Get("password") == Value { "secret" });
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.DefaultFunction", "[Resource]")
{
    auto& product = DefineProduct();
    product.DeclareProperty("slug",
                            PropertyType::String,
                            PropertyOptions {
                                .defaultValue = DefaultFunction { [](Resource const& resource, Property const&) {
                                    return Value { std::format("{}-slug", resource.GetModel().Name()) };
                                } },
                            });

    auto const resource = product.New({ { "name", "Hammer" } });
    REQUIRE(resource->Save());
    CHECK(repository->TableOf(product).front().at("slug") == Value { "Product-slug" });
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Typecast", "[Resource]")
{
    auto& product = DefineProduct();
    auto const resource = product.New({ { "name", 42 }, { "category_id", "7" }, { "active", 1 } });
    CHECK(resource->Get("name") == Value { "42" });
    CHECK(resource->Get("category_id") == Value { 7 });
    CHECK(resource->Get("active") == Value { true });
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Reload", "[Resource]")
{
    auto& product = DefineProduct();
    repository->Insert(product, Row { { "id", 1 }, { "type", "Product" }, { "name", "Hammer" } });

    auto const hammer = product.Get(Key { 1 });
    REQUIRE(hammer);
    REQUIRE(hammer->Get("name") == Value { "Hammer" });

    hammer->Set("name", "Mallet");
    REQUIRE(hammer->IsDirty());

    repository->TableOf(product).front().insert_or_assign("name", Value { "Sledge" });

    hammer->Reload();
    CHECK(!hammer->IsDirty());
    CHECK(hammer->Get("name") == Value { "Sledge" });
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.Inspect", "[Resource]")
{
    auto& product = DefineProduct();
    auto const resource = product.New({ { "name", "Hammer" } });

    CHECK(resource->Inspect() == R"(#<Product id=NULL type=NULL name="Hammer" category_id=NULL active=NULL>)");
    CHECK(std::format("{}", *resource) == resource->Inspect());

    repository->Insert(product, Row { { "id", 7 }, { "type", "Product" }, { "name", "Saw" } });
    auto const saw = product.Get(Key { 7 });
    REQUIRE(saw);
    CHECK(saw->Inspect()
          == R"(#<Product id=7 type="Product" name=<not loaded> category_id=<not loaded> active=<not loaded>>)");
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.SingleTableInheritance", "[Resource]")
{
    auto& product = DefineProduct();
    auto& book = product.Inherit("Book");
    book.DeclareProperty("isbn", PropertyType::String);

    auto const novel = book.New({ { "name", "Novel" }, { "isbn", "978-3" } });
    REQUIRE(novel->Save());
    CHECK(repository->TableOf(product).front().at("type") == Value { "Book" });

    repository->Insert(product, Row { { "id", 2 }, { "type", "Product" }, { "name", "Hammer" } });

    // Reading the base model materializes the subclass named by the discriminator.
    repository->IdentityMapFor(product).Erase(Key { 1 });
    auto const all = product.All();
    REQUIRE(all->Size() == 2);
    CHECK(&all->All()[0]->GetModel() == &book);
    CHECK(&all->All()[1]->GetModel() == &product);

    // Reading the subclass only yields its own rows.
    auto const books = book.All();
    REQUIRE(books->Size() == 1);
    CHECK(books->First()->Get("isbn") == Value { "978-3" });
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.LazyLoadGroups", "[Resource]")
{
    auto& article = registry.DefineModel("Article");
    article.DeclareProperty("id", PropertyType::Integer, PropertyOptions { .nullable = false, .serial = true });
    article.DeclareProperty("title", PropertyType::String);
    article.DeclareProperty("body", PropertyType::Text, PropertyOptions { .lazy = true, .lazyGroups = { "details" } });
    article.DeclareProperty("summary", PropertyType::Text, PropertyOptions { .lazy = true, .lazyGroups = { "details" } });
    article.DeclareProperty("notes", PropertyType::Text, PropertyOptions { .lazy = true, .lazyGroups = { "audit" } });

    repository->Insert(article,
                       Row { { "id", 1 },
                             { "title", "Hello" },
                             { "body", "Lorem ipsum" },
                             { "summary", "Lorem" },
                             { "notes", "reviewed" } });

    auto const hello = article.Get(Key { 1 });
    REQUIRE(hello);
    REQUIRE(!hello->IsAttributeLoaded("body"));

    auto logger = ScopedRecordingLogger {};
    auto const reads = repository->counters.reads;

    CHECK(hello->Get("body") == Value { "Lorem ipsum" });
    CHECK(repository->counters.reads == reads + 1);
    REQUIRE(logger.lazyLoadedProperties.size() == 1);
    CHECK(logger.lazyLoadedProperties.front() == std::vector<std::string> { "body", "summary" });

    CHECK(hello->IsAttributeLoaded("summary"));
    CHECK(!hello->IsAttributeLoaded("notes"));
    CHECK(!hello->IsAttributeLoaded("title"));

    // The rest of the group is served without another read.
    CHECK(hello->Get("summary") == Value { "Lorem" });
    CHECK(repository->counters.reads == reads + 1);

    CHECK(hello->Get("notes") == Value { "reviewed" });
    CHECK(repository->counters.reads == reads + 2);
    CHECK(!hello->IsAttributeLoaded("title"));
}

TEST_CASE_METHOD(QuarryTestFixture, "Resource.ReloadChildren", "[Resource]")
{
    auto& category = DefineCategory();
    auto& product = DefineProduct();
    category.Has(N, "products");

    repository->Insert(category, Row { { "id", 1 }, { "name", "Tools" } });
    repository->Insert(product, Row { { "id", 1 }, { "type", "Product" }, { "name", "Hammer" }, { "category_id", 1 } });
    repository->Insert(product, Row { { "id", 2 }, { "type", "Product" }, { "name", "Saw" }, { "category_id", 1 } });

    auto const tools = category.Get(Key { 1 });
    REQUIRE(tools);
    auto const products = tools->GetMany("products");
    REQUIRE(products->Size() == 2);
    auto const hammer = products->All()[0];
    auto const saw = products->All()[1];

    hammer->Set("name", "Mallet");
    REQUIRE(hammer->IsDirty());

    auto& rows = repository->TableOf(product);
    rows[0].insert_or_assign("name", Value { "Claw hammer" });
    rows[1].insert_or_assign("name", Value { "Hacksaw" });

    auto const reads = repository->counters.reads;
    tools->Reload();

    // One read for the category, one for all of its products.
    CHECK(repository->counters.reads == reads + 2);
    auto const& siblingsQuery = repository->readQueries.back();
    CHECK(&siblingsQuery.GetModel() == &product);
    REQUIRE(!siblingsQuery.Conditions().empty());
    CHECK(siblingsQuery.Conditions().front().values.size() == 2);

    CHECK(!hammer->IsDirty());
    CHECK(hammer->Get("name") == Value { "Claw hammer" });
    CHECK(saw->Get("name") == Value { "Hacksaw" });
    CHECK(tools->GetMany("products") == products);
}
