#include <gtest/gtest.h>

#include <algorithm>

#include "helpers/Extensions.hpp"
#include "scan/DirectoryScanner.hpp"
#include "TestHelpers.hpp"

class DirectoryScannerTest : public ::testing::Test {
  protected:
    CTempDir tmp;

    void     SetUp() override {
        writeFile(tmp / "a.jpg", "x");
        writeFile(tmp / "B.PNG", "x");
        writeFile(tmp / "notes.txt", "x");
        writeFile(tmp / "README", "x");
        writeFile(tmp / ".hidden.jpg", "x");
        writeFile(tmp / ".thumbs/c.jpg", "x");
        writeFile(tmp / "sub/deeper/d.gif", "x");
        writeFile(tmp / "sub/e.jpeg", "x");
        writeFile(tmp / "sub/f.html", "x");
    }
};

TEST_F(DirectoryScannerTest, FindsImagesRecursively) {
    const auto FILES = DirectoryScanner::scan(tmp.path());
    ASSERT_TRUE(FILES.has_value()) << FILES.error();

    const std::vector<std::string> EXPECTED = {tmp / "B.PNG", tmp / "a.jpg", tmp / "sub/deeper/d.gif", tmp / "sub/e.jpeg"};

    auto                           got = *FILES;
    std::ranges::sort(got);
    EXPECT_EQ(got, EXPECTED);
}

TEST_F(DirectoryScannerTest, EverythingIsUnderRootAndAnImage) {
    const auto FILES = DirectoryScanner::scan(tmp.path() + "/");
    ASSERT_TRUE(FILES.has_value());

    for (const auto& f : *FILES) {
        EXPECT_TRUE(f.starts_with(tmp.path() + "/")) << f;
        EXPECT_TRUE(Extensions::hasImageExtension(f)) << f;
        EXPECT_EQ(f.find("/."), std::string::npos) << f;
    }
}

TEST_F(DirectoryScannerTest, SymlinkLoopTerminates) {
    std::filesystem::create_directory_symlink(tmp.path(), tmp / "sub/loop");
    std::filesystem::create_directory_symlink(tmp / "sub", tmp / "sub/deeper/up");

    const auto FILES = DirectoryScanner::scan(tmp.path());
    ASSERT_TRUE(FILES.has_value());

    // every image shows up exactly once, the loops add nothing
    EXPECT_EQ(FILES->size(), 4u);
    auto sorted = *FILES;
    std::ranges::sort(sorted);
    EXPECT_EQ(std::ranges::adjacent_find(sorted), sorted.end());
}

TEST_F(DirectoryScannerTest, SymlinkedDirectoryIsFollowedOnce) {
    CTempDir other;
    writeFile(other / "g.jpg", "x");
    std::filesystem::create_directory_symlink(other.path(), tmp / "linked");
    std::filesystem::create_directory_symlink(other.path(), tmp / "linked2");

    const auto FILES = DirectoryScanner::scan(tmp.path());
    ASSERT_TRUE(FILES.has_value());

    const auto COUNT = std::ranges::count_if(*FILES, [](const auto& f) { return f.ends_with("/g.jpg"); });
    EXPECT_EQ(COUNT, 1);
}

TEST_F(DirectoryScannerTest, DanglingSymlinkIsSkipped) {
    std::filesystem::create_symlink(tmp / "nowhere", tmp / "dangling");

    const auto FILES = DirectoryScanner::scan(tmp.path());
    ASSERT_TRUE(FILES.has_value());
    EXPECT_EQ(FILES->size(), 4u);
}

TEST_F(DirectoryScannerTest, DenyListedNamesAreNotDescended) {
    writeFile(tmp / "archive.zip/inside.jpg", "x");

    const auto FILES = DirectoryScanner::scan(tmp.path());
    ASSERT_TRUE(FILES.has_value());
    EXPECT_TRUE(std::ranges::none_of(*FILES, [](const auto& f) { return f.contains("archive.zip"); }));
}

TEST_F(DirectoryScannerTest, MissingRootIsAnError) {
    EXPECT_FALSE(DirectoryScanner::scan(tmp / "does-not-exist").has_value());
    EXPECT_FALSE(DirectoryScanner::scan(tmp / "a.jpg").has_value());
}

TEST_F(DirectoryScannerTest, ContextCountsWork) {
    DirectoryScanner::SScanContext ctx;
    DirectoryScanner::scanDirectory(tmp.path(), ctx);

    EXPECT_EQ(ctx.files.size(), 4u);
    // README and sub are stat'ed, the jpgs, txt and html are not. deeper is stat'ed inside sub.
    EXPECT_EQ(ctx.statCalls, 3u);
}

TEST(ExtensionsTest, Classification) {
    EXPECT_EQ(Extensions::extensionOf("/a/b/Photo.JPG"), "jpg");
    EXPECT_EQ(Extensions::extensionOf("/a/b.d/file"), "");
    EXPECT_EQ(Extensions::extensionOf(".bashrc"), "");
    EXPECT_EQ(Extensions::extensionOfURL("http://x.org/a/b.png?w=100#top"), "png");
    EXPECT_EQ(Extensions::extensionOfURL("http://x.org"), "");
    EXPECT_EQ(Extensions::extensionOfURL("http://x.org/"), "");
    EXPECT_TRUE(Extensions::isImage("jpeg"));
    EXPECT_FALSE(Extensions::isImage("webp"));
    EXPECT_TRUE(Extensions::isKnownNonDirectory("zip"));
    EXPECT_FALSE(Extensions::isKnownNonDirectory("d"));
}
