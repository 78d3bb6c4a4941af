#include "path_codec.hpp"
#include "path_resolver.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace statik;

namespace {

const std::string kRoot = "/srv/www";

} // namespace

TEST(NormalizePathTest, CollapsesDotsAndSeparators) {
    EXPECT_EQ(normalize_path("/a/./b//c/"), "/a/b/c");
    EXPECT_EQ(normalize_path("/a/b/../c"), "/a/c");
    EXPECT_EQ(normalize_path("/../.."), "/");
    EXPECT_EQ(normalize_path("/"), "/");
    EXPECT_EQ(normalize_path("//"), "/");
}

TEST(IsWithinRootTest, RequiresSeparatorBoundary) {
    EXPECT_TRUE(is_within_root("/srv/www", "/srv/www"));
    EXPECT_TRUE(is_within_root("/srv/www", "/srv/www/a"));
    EXPECT_FALSE(is_within_root("/srv/www", "/srv/wwwroot"));
    EXPECT_FALSE(is_within_root("/srv/www", "/srv/ww"));
    EXPECT_FALSE(is_within_root("/srv/www", "/etc/passwd"));
    EXPECT_TRUE(is_within_root("/", "/anything"));
}

TEST(ResolveTargetTest, JoinsRequestPathOntoRoot) {
    EXPECT_EQ(resolve_target(kRoot, "/index.html").path(), "/srv/www/index.html");
    EXPECT_EQ(resolve_target(kRoot, "/docs/a.txt").path(), "/srv/www/docs/a.txt");
    EXPECT_EQ(resolve_target(kRoot, "docs").path(), "/srv/www/docs");
}

TEST(ResolveTargetTest, EmptyOrSlashResolvesToRoot) {
    for (const char* p : {"", "/", "//", "/./", "/a/.."}) {
        ResolvedTarget t = resolve_target(kRoot, p);
        EXPECT_EQ(t.path(), kRoot) << "input: '" << p << "'";
        EXPECT_TRUE(t.is_root());
        EXPECT_EQ(t.relative_path(), "/");
    }
}

TEST(ResolveTargetTest, NormalizesRepeatedAndTrailingSeparators) {
    EXPECT_EQ(resolve_target(kRoot, "//docs///a.txt").path(), "/srv/www/docs/a.txt");
    EXPECT_EQ(resolve_target(kRoot, "/docs/").path(), "/srv/www/docs");
    EXPECT_EQ(resolve_target(kRoot, "/docs/./sub/../a.txt").path(), "/srv/www/docs/a.txt");
}

TEST(ResolveTargetTest, RejectsTraversal) {
    EXPECT_THROW(resolve_target(kRoot, "/../../etc/passwd"), PathTraversalError);
    EXPECT_THROW(resolve_target(kRoot, ".."), PathTraversalError);
    EXPECT_THROW(resolve_target(kRoot, "/docs/../../x"), PathTraversalError);
}

TEST(ResolveTargetTest, RejectsEncodedTraversal) {
    EXPECT_THROW(resolve_target(kRoot, percent_decode("/%2e%2e/%2e%2e/etc/passwd")), PathTraversalError);
    EXPECT_THROW(resolve_target(kRoot, percent_decode("/..%2f..%2fetc")), PathTraversalError);
}

TEST(ResolveTargetTest, RejectsSiblingSharingRootPrefix) {
    EXPECT_THROW(resolve_target(kRoot, "/../wwwroot/secret"), PathTraversalError);
    EXPECT_THROW(resolve_target(kRoot, "/../www-old"), PathTraversalError);
}

TEST(ResolveTargetTest, AllowsDetourThatReturnsInsideRoot) {
    EXPECT_EQ(resolve_target(kRoot, "/../www/a.txt").path(), "/srv/www/a.txt");
}

TEST(ResolveTargetTest, RejectsEmbeddedNul) {
    EXPECT_THROW(resolve_target(kRoot, std::string("/a.txt\0.png", 11)), PathTraversalError);
}

TEST(ResolveTargetTest, FilesystemRootAdmitsEverything) {
    ResolvedTarget t = resolve_target("/", "/../etc/passwd");
    EXPECT_EQ(t.path(), "/etc/passwd");
    EXPECT_EQ(t.relative_path(), "/etc/passwd");
}

TEST(ResolveTargetTest, RelativePathIsRequestStyle) {
    EXPECT_EQ(resolve_target(kRoot, "/docs//sub/").relative_path(), "/docs/sub");
}

// Every combination of up to four segments either stays inside root or throws
TEST(ResolveTargetTest, NeverEscapesRoot) {
    const std::vector<std::string> pieces = {"..", ".", "", "www", "a", "%2e%2e", "wwwx"};
    std::vector<size_t> idx(4, 0);
    size_t checked = 0;

    for (;;) {
        std::string raw;
        for (size_t i : idx) {
            raw += "/" + pieces[i];
        }
        std::string decoded = percent_decode(raw);
        try {
            ResolvedTarget t = resolve_target(kRoot, decoded);
            EXPECT_TRUE(t.path() == kRoot || t.path().rfind(kRoot + "/", 0) == 0)
                << raw << " -> " << t.path();
        } catch (const PathTraversalError&) {
        }
        ++checked;

        size_t k = 0;
        while (k < idx.size() && ++idx[k] == pieces.size()) {
            idx[k++] = 0;
        }
        if (k == idx.size()) break;
    }
    EXPECT_EQ(checked, 7u * 7u * 7u * 7u);
}
