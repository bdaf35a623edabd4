#include <gtest/gtest.h>
#include <climits>
#include <unistd.h>

#include "ResourceResolver.hpp"
#include "TestSupport.hpp"

TEST(ParseRequestPathTest, ExtractsPathBetweenSlashAndSpace) {
    std::string path;
    ASSERT_TRUE(parseRequestPath("GET /index.html HTTP/1.1", path));
    EXPECT_EQ("index.html", path);

    ASSERT_TRUE(parseRequestPath("GET /dir/page.html HTTP/1.1", path));
    EXPECT_EQ("dir/page.html", path);

    ASSERT_TRUE(parseRequestPath("HEAD /a?b=c HTTP/1.0", path));
    EXPECT_EQ("a?b=c", path);
}

TEST(ParseRequestPathTest, RootIsEmptyPath) {
    std::string path = "junk";
    ASSERT_TRUE(parseRequestPath("GET / HTTP/1.1", path));
    EXPECT_EQ("", path);
}

TEST(ParseRequestPathTest, MethodIsNotValidated) {
    std::string path;
    ASSERT_TRUE(parseRequestPath("BREW /pot HTTP/1.1", path));
    EXPECT_EQ("pot", path);
}

TEST(ParseRequestPathTest, MalformedLines) {
    std::string path;
    EXPECT_FALSE(parseRequestPath("", path));
    EXPECT_FALSE(parseRequestPath("GARBAGE", path));
    EXPECT_FALSE(parseRequestPath("GET index.html HTTP/1.1", path));
    EXPECT_FALSE(parseRequestPath("GET /index.html", path));
}

class ResourceResolverTest : public ::testing::Test {
protected:
    TempDir root;

    void SetUp() {
        root.write("TestBase.html", "<html>{{cs371date}}</html>");
        root.write("real.txt", "hello");
        root.mkdir("sub");
        root.write("sub/page.html", "<p>sub</p>");
    }
};

TEST_F(ResourceResolverTest, EmptyPathIsHome) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("GET / HTTP/1.1");
    EXPECT_EQ(Resolution::HOME, r.kind);
    EXPECT_TRUE(r.found());
}

TEST_F(ResourceResolverTest, ExistingFileIsFile) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("GET /real.txt HTTP/1.1");
    ASSERT_EQ(Resolution::REGULAR_FILE, r.kind);
    EXPECT_EQ("real.txt", r.requestPath);

    char canonical[PATH_MAX];
    ASSERT_TRUE(realpath(root.file("real.txt").c_str(), canonical) != NULL);
    EXPECT_EQ(std::string(canonical), r.filePath);
}

TEST_F(ResourceResolverTest, NestedFileIsFile) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("GET /sub/page.html HTTP/1.1");
    EXPECT_EQ(Resolution::REGULAR_FILE, r.kind);
}

TEST_F(ResourceResolverTest, AbsentFileIsMissing) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("GET /missing.html HTTP/1.1");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_NOT_FOUND, r.reason);
}

TEST_F(ResourceResolverTest, DirectoryIsMissing) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("GET /sub HTTP/1.1");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_NOT_REGULAR, r.reason);
}

TEST_F(ResourceResolverTest, MalformedRequestIsMissing) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("NONSENSE");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_MALFORMED, r.reason);

    r = resolver.resolve("GET /real.txt");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_MALFORMED, r.reason);
}

TEST_F(ResourceResolverTest, EmptyRequestLineIsMissing) {
    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_EMPTY_REQUEST, r.reason);
}

TEST_F(ResourceResolverTest, TraversalOutsideRootIsMissing) {
    TempDir outer;
    outer.mkdir("docs");
    outer.write("secret.txt", "top secret");
    outer.write("docs/ok.txt", "ok");

    ResourceResolver resolver(outer.file("docs"));
    EXPECT_EQ(Resolution::REGULAR_FILE, resolver.resolve("GET /ok.txt HTTP/1.1").kind);

    Resolution r = resolver.resolve("GET /../secret.txt HTTP/1.1");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_OUTSIDE_ROOT, r.reason);
}

TEST_F(ResourceResolverTest, SymlinkOutsideRootIsMissing) {
    TempDir outer;
    outer.write("secret.txt", "top secret");
    ASSERT_EQ(0, symlink(outer.file("secret.txt").c_str(), root.file("link.txt").c_str()));

    ResourceResolver resolver(root.str());
    Resolution r = resolver.resolve("GET /link.txt HTTP/1.1");
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_OUTSIDE_ROOT, r.reason);
}

TEST_F(ResourceResolverTest, AbsolutePathStaysUnderRoot) {
    ResourceResolver resolver(root.str());
    // "GET //etc/passwd" は root + "//etc/passwd" になる
    Resolution r = resolver.resolve("GET //etc/passwd HTTP/1.1");
    EXPECT_EQ(Resolution::MISSING, r.kind);
}

TEST_F(ResourceResolverTest, ClassificationReflectsCurrentFilesystem) {
    ResourceResolver resolver(root.str());
    EXPECT_EQ(Resolution::MISSING, resolver.resolve("GET /late.txt HTTP/1.1").kind);
    root.write("late.txt", "now here");
    EXPECT_EQ(Resolution::REGULAR_FILE, resolver.resolve("GET /late.txt HTTP/1.1").kind);
}

TEST_F(ResourceResolverTest, EmbeddedNulIsMissing) {
    ResourceResolver resolver(root.str());
    // stat() に渡すと "real.txt" で切れてしまうパス
    std::string line("GET /real.txt\0.png HTTP/1.1", 27);
    ASSERT_EQ(27u, line.size());

    Resolution r = resolver.resolve(line);
    EXPECT_EQ(Resolution::MISSING, r.kind);
    EXPECT_EQ(Resolution::REASON_NOT_FOUND, r.reason);
}
