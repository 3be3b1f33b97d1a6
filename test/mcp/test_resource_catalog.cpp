#include <catch2/catch_test_macros.hpp>

#include <mcp_guard/mcp/resource_catalog.hpp>

#include <set>
#include <stdexcept>
#include <string>

using namespace mcp_guard;

namespace {

ResourceDefinition Resource(const std::string& uri) {
    ResourceDefinition d;
    d.uri = uri;
    d.name = uri;
    d.description = "A resource";
    return d;
}

CallerIdentity User(const std::string& id, std::set<std::string> scopes = {}) {
    CallerIdentity caller;
    caller.subject_id = id;
    caller.scopes = std::move(scopes);
    return caller;
}

} // anonymous namespace

// ===========================================================================
// Add
// ===========================================================================

TEST_CASE("ResourceCatalog: rejects empty uri and duplicates", "[resources]") {
    ResourceCatalog catalog(true);
    CHECK(catalog.AddStatic(Resource(""), "x").IsErr());

    REQUIRE(catalog.AddStatic(Resource("file://readme"), "hello").IsOk());
    auto dup = catalog.AddStatic(Resource("file://readme"), "again");
    REQUIRE(dup.IsErr());
    CHECK(dup.Error().message == "resource 'file://readme' already registered");
}

TEST_CASE("ResourceCatalog: rejects a missing provider", "[resources]") {
    ResourceCatalog catalog(true);
    CHECK(catalog.Add(Resource("file://x"), ResourceProvider{}).IsErr());
}

TEST_CASE("ResourceCatalog: descriptions are sanitized", "[resources]") {
    ResourceCatalog catalog(true);
    auto d = Resource("file://x");
    d.description = "Notes <script>alert(1)</script>";
    REQUIRE(catalog.AddStatic(d, "x").IsOk());

    auto visible = catalog.Visible(CallerIdentity::Anonymous());
    REQUIRE(visible.size() == 1);
    CHECK(visible[0].description.find("<script>") == std::string::npos);
}

// ===========================================================================
// Visibility
// ===========================================================================

TEST_CASE("ResourceCatalog: hides resources the caller cannot access", "[resources]") {
    ResourceCatalog catalog(true);
    REQUIRE(catalog.AddStatic(Resource("file://public"), "p").IsOk());

    auto members = Resource("file://members");
    members.require_auth = true;
    REQUIRE(catalog.AddStatic(members, "m").IsOk());

    auto reports = Resource("file://reports");
    reports.scopes.required = {"reports:read"};
    REQUIRE(catalog.AddStatic(reports, "r").IsOk());

    CHECK(catalog.Visible(CallerIdentity::Anonymous()).size() == 1);
    CHECK(catalog.Visible(User("alice")).size() == 2);
    CHECK(catalog.Visible(User("bob", {"reports:read"})).size() == 3);
}

TEST_CASE("ResourceCatalog: any-of scopes", "[resources]") {
    auto d = Resource("file://ops");
    d.scopes.any_of = {"ops", "admin"};

    CHECK_FALSE(ResourceCatalog::CanAccess(d, User("alice")));
    CHECK(ResourceCatalog::CanAccess(d, User("alice", {"ops"})));
    CHECK(ResourceCatalog::CanAccess(d, User("root", {"admin"})));
}

// ===========================================================================
// Read
// ===========================================================================

TEST_CASE("ResourceCatalog: Read returns the contents envelope", "[resources]") {
    ResourceCatalog catalog(true);
    auto d = Resource("file://readme");
    d.mime_type = "text/markdown";
    REQUIRE(catalog.AddStatic(d, "# Hello").IsOk());

    auto result = catalog.Read("file://readme", CallerIdentity::Anonymous());
    REQUIRE(result.IsOk());
    const auto& contents = result.Value()["contents"];
    REQUIRE(contents.size() == 1);
    CHECK(contents[0]["uri"] == "file://readme");
    CHECK(contents[0]["mimeType"] == "text/markdown");
    CHECK(contents[0]["text"] == "# Hello");
}

TEST_CASE("ResourceCatalog: provider sees the caller", "[resources]") {
    ResourceCatalog catalog(true);
    REQUIRE(catalog.Add(Resource("mem://whoami"), [](const CallerIdentity& caller) {
        return caller.RateKey();
    }).IsOk());

    auto result = catalog.Read("mem://whoami", User("alice"));
    REQUIRE(result.IsOk());
    CHECK(result.Value()["contents"][0]["text"] == "alice");
}

TEST_CASE("ResourceCatalog: forbidden reads look like missing ones", "[resources]") {
    ResourceCatalog catalog(true);
    auto members = Resource("file://members");
    members.require_auth = true;
    REQUIRE(catalog.AddStatic(members, "m").IsOk());

    auto forbidden = catalog.Read("file://members", CallerIdentity::Anonymous());
    auto missing = catalog.Read("file://nothing", CallerIdentity::Anonymous());
    REQUIRE(forbidden.IsErr());
    REQUIRE(missing.IsErr());
    CHECK(forbidden.Error().category == ErrorCategory::NotFound);
    CHECK(missing.Error().category == ErrorCategory::NotFound);
    CHECK(forbidden.Error().message == "Resource 'file://members' not found");
}

TEST_CASE("ResourceCatalog: provider failure is a collaborator error", "[resources]") {
    ResourceCatalog catalog(true);
    REQUIRE(catalog.Add(Resource("mem://broken"), [](const CallerIdentity&) -> std::string {
        throw std::runtime_error("disk unavailable");
    }).IsOk());

    auto result = catalog.Read("mem://broken", CallerIdentity::Anonymous());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Collaborator);
    CHECK(result.Error().message == "disk unavailable");
}

TEST_CASE("ResourceDefinition: ListJson shape", "[resources]") {
    auto d = Resource("file://readme");
    auto j = d.ListJson();
    CHECK(j["uri"] == "file://readme");
    CHECK(j["name"] == "file://readme");
    CHECK(j["description"] == "A resource");
    CHECK(j["mimeType"] == "text/plain");
}
