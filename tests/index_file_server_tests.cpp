#include "test_common.hpp"
#include "fake_vcs.hpp"
#include "index_file_server.hpp"
#include <unistd.h>

using indexmirror::test_support::scratch_dir;
using indexmirror::test_support::StaticVcs;
using mirror::IndexFileServer;
using mirror::IndexRequest;
using mirror::IndexResponse;
using mirror::RepositoryMirror;

namespace {

const std::string CONFIG = "{\"dl\":\"https://example.com/api/v1/crates\",\"api\":null}";
const std::string SERDE = "{\"name\":\"serde\",\"vers\":\"1.0.0\"}\n";

StaticVcs::Tree index_tree() {
    return {{"config.json", CONFIG},
            {"se/rd/serde", SERDE},
            {"3/s/syn", "{\"name\":\"syn\"}\n"},
            {"notes/read me.txt", "a & b"}};
}

std::map<std::string, StaticVcs::Tree> revisions() {
    return {{"r1", index_tree()}, {"r2", {{"config.json", "{}"}}}};
}

IndexResponse get(const IndexFileServer& srv, const std::string& path,
                  std::optional<std::string> inm = std::nullopt) {
    IndexRequest req;
    req.path = path;
    req.if_none_match = std::move(inm);
    return srv.handle(req);
}

struct ServedMirror {
    fs::path dir;
    StaticVcs vcs{revisions()};
    RepositoryMirror mirror{vcs};
    explicit ServedMirror(const std::string& name) : dir(scratch_dir(name)) {
        mirror.ensure_initialized("https://example.com/index.git", dir);
    }
    ~ServedMirror() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

TEST_CASE("IndexFileServer returns exact file bytes") {
    ServedMirror m("ifs_ok");
    IndexFileServer srv(m.mirror);

    auto res = get(srv, "/config.json");
    REQUIRE(res.status == 200);
    REQUIRE(res.body == CONFIG);
    REQUIRE(res.headers["Content-Type"] == "application/json");
    REQUIRE(res.headers["Content-Length"] == std::to_string(CONFIG.size()));
    REQUIRE(res.headers["ETag"] == "\"r1\"");
    REQUIRE(res.headers["X-Mirror-Revision"] == "r1");

    res = get(srv, "/se/rd/serde?cache=no#frag");
    REQUIRE(res.status == 200);
    REQUIRE(res.body == SERDE);
    REQUIRE(res.headers["Content-Type"] == "application/octet-stream");

    res = get(srv, "//se/./rd//serde");
    REQUIRE(res.status == 200);
    REQUIRE(res.body == SERDE);

    res = get(srv, "/notes/read%20me.txt");
    REQUIRE(res.status == 200);
    REQUIRE(res.body == "a & b");
}

TEST_CASE("IndexFileServer answers 404 for missing files") {
    ServedMirror m("ifs_missing");
    IndexFileServer srv(m.mirror);
    auto res = get(srv, "/no/such/crate");
    REQUIRE(res.status == 404);
    REQUIRE(res.body == "404 Not Found\n");
    REQUIRE(get(srv, "/config.json/extra").status == 404);
}

TEST_CASE("IndexFileServer rejects traversal and bad escapes") {
    ServedMirror m("ifs_traversal");
    IndexFileServer srv(m.mirror);
    for (const char* path : {"/../../etc/passwd", "/..%2f..%2fetc/passwd", "/se/%2e%2e/%2e%2e/x",
                             "/config.json%00", "/se\\rd", "/bad%zzescape", "/trailing%2"}) {
        INFO(path);
        auto res = get(srv, path);
        REQUIRE(res.status == 400);
        REQUIRE(res.body == "400 Bad Request\n");
    }
}

TEST_CASE("IndexFileServer refuses symlinks leaving the snapshot") {
    ServedMirror m("ifs_symlink");
    fs::path outside = scratch_dir("ifs_symlink_outside");
    indexmirror::test_support::write_file(outside / "secret", "secret");
    fs::create_symlink(outside / "secret", m.mirror.current_root() / "escape");
    fs::create_symlink("config.json", m.mirror.current_root() / "alias.json");

    IndexFileServer srv(m.mirror);
    REQUIRE(get(srv, "/escape").status == 400);
    auto res = get(srv, "/alias.json");
    REQUIRE(res.status == 200);
    REQUIRE(res.body == CONFIG);
    FS_REMOVE_ALL(outside);
}

TEST_CASE("IndexFileServer answers 500 when a present file cannot be read") {
    ServedMirror m("ifs_unreadable");
    IndexFileServer srv(m.mirror);
    const fs::path root = m.mirror.current_root();

    fs::create_symlink("loop", root / "loop");
    auto res = get(srv, "/loop");
    REQUIRE(res.status == 500);
    REQUIRE(res.body == "500 Internal Server Error\n");

    if (geteuid() != 0) {
        fs::permissions(root / "se", fs::perms::none);
        REQUIRE(get(srv, "/se/rd/serde").status == 500);
        REQUIRE(get(srv, "/se/rd/missing").status == 500);
        fs::permissions(root / "se", fs::perms::owner_all);
    } else {
        WARN("running as root; skipping permission check");
    }
    REQUIRE(get(srv, "/se/rd/serde").status == 200);

    auto held = m.mirror.current();
    FS_REMOVE_ALL(root);
    REQUIRE(get(srv, "/config.json").status == 500);
    REQUIRE(get(srv, "/no/such/file").status == 500);
}

TEST_CASE("IndexFileServer honours If-None-Match") {
    ServedMirror m("ifs_etag");
    IndexFileServer srv(m.mirror);
    auto res = get(srv, "/config.json", std::string("\"r1\""));
    REQUIRE(res.status == 304);
    REQUIRE(res.body.empty());
    REQUIRE(res.headers["ETag"] == "\"r1\"");

    REQUIRE(get(srv, "/config.json", std::string("\"old\", W/\"r1\"")).status == 304);
    REQUIRE(get(srv, "/config.json", std::string("*")).status == 304);
    REQUIRE(get(srv, "/config.json", std::string("\"old\"")).status == 200);
    REQUIRE(get(srv, "/missing", std::string("*")).status == 404);
}

TEST_CASE("IndexFileServer serves the new revision after a refresh") {
    ServedMirror m("ifs_refresh");
    IndexFileServer srv(m.mirror);
    m.vcs.set_upstream("r2");
    REQUIRE(m.mirror.refresh() == mirror::RefreshOutcome::Updated);

    auto res = get(srv, "/config.json", std::string("\"r1\""));
    REQUIRE(res.status == 200);
    REQUIRE(res.body == "{}");
    REQUIRE(res.headers["ETag"] == "\"r2\"");
    REQUIRE(get(srv, "/se/rd/serde").status == 404);
}

TEST_CASE("IndexFileServer lists directories") {
    ServedMirror m("ifs_listing");
    IndexFileServer srv(m.mirror);

    auto root = get(srv, "/");
    REQUIRE(root.status == 200);
    REQUIRE(root.headers["Content-Type"] == "text/html; charset=utf-8");
    REQUIRE(root.body.find("Index of /") != std::string::npos);
    REQUIRE(root.body.find("href=\"/se/\"") != std::string::npos);
    REQUIRE(root.body.find("href=\"/config.json\"") != std::string::npos);
    REQUIRE(root.body.find("href=\"../\"") == std::string::npos);
    REQUIRE(root.body.find("/se/") < root.body.find("config.json"));

    auto notes = get(srv, "/notes/");
    REQUIRE(notes.status == 200);
    REQUIRE(notes.body.find("Index of /notes/") != std::string::npos);
    REQUIRE(notes.body.find("href=\"../\"") != std::string::npos);
    REQUIRE(notes.body.find("href=\"/notes/read%20me.txt\"") != std::string::npos);

    IndexFileServer quiet(m.mirror, false);
    REQUIRE(quiet.handle({"/se", std::nullopt}).status == 404);
    REQUIRE(quiet.handle({"/", std::nullopt}).status == 404);
    REQUIRE(quiet.handle({"/config.json", std::nullopt}).status == 200);
}

TEST_CASE("IndexFileServer answers 503 before initialization") {
    StaticVcs vcs(revisions());
    RepositoryMirror idle(vcs);
    IndexFileServer srv(idle);
    auto res = get(srv, "/config.json");
    REQUIRE(res.status == 503);
    REQUIRE(res.body == "503 Service Unavailable\n");
    REQUIRE(get(srv, "/../x").status == 400);
}

TEST_CASE("normalize_path splits and decodes") {
    using V = std::vector<std::string>;
    REQUIRE(IndexFileServer::normalize_path("/") == V{});
    REQUIRE(IndexFileServer::normalize_path("/a/./b//c") == V{"a", "b", "c"});
    REQUIRE(IndexFileServer::normalize_path("/a%2Fb") == V{"a", "b"});
    REQUIRE(IndexFileServer::normalize_path("/x?y=/../z") == V{"x"});
    REQUIRE_THROWS_AS(IndexFileServer::normalize_path("/a/../b"), mirror::RequestPathError);
}

TEST_CASE("content_type_for maps extensions") {
    REQUIRE(IndexFileServer::content_type_for("config.json") == "application/json");
    REQUIRE(IndexFileServer::content_type_for("INDEX.JSON") == "application/json");
    REQUIRE(IndexFileServer::content_type_for("serde") == "application/octet-stream");
    REQUIRE(IndexFileServer::content_type_for("README.md") == "text/markdown; charset=utf-8");
}
