#include "scratch_dir.hpp"
#include <managers/file_scanner.hpp>
#include <algorithm>
#include <set>

class FileScannerTest : public ScratchDirTest {
protected:
    std::set<std::string> names(const std::vector<FileRecord>& files) {
        std::set<std::string> out;
        for (const auto& f : files) out.insert(fs::path(f.path).lexically_relative(test_dir).generic_string());
        return out;
    }
};

TEST_F(FileScannerTest, NonRecursiveListsDirectChildrenOnly) {
    write_file("a.txt");
    write_file("b.txt");
    write_file("sub/c.txt");

    FileScanner scanner(test_dir, "", false, false);
    auto files = scanner.collect();

    EXPECT_EQ(names(files), (std::set<std::string>{"a.txt", "b.txt"}));
}

TEST_F(FileScannerTest, RecursiveWalksSubdirectories) {
    write_file("a.txt");
    write_file("sub/c.txt");
    write_file("sub/deeper/d.txt");

    FileScanner scanner(test_dir, "", true, false);
    auto files = scanner.collect();

    EXPECT_EQ(names(files), (std::set<std::string>{"a.txt", "sub/c.txt", "sub/deeper/d.txt"}));
}

TEST_F(FileScannerTest, RecordsCarrySizeAndMtime) {
    write_file("data.bin", 1234, 1700000000);

    FileScanner scanner(test_dir, "", false, false);
    auto files = scanner.collect();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "data.bin");
    EXPECT_EQ(files[0].size_bytes, 1234);
    EXPECT_DOUBLE_EQ(files[0].mtime, 1700000000.0);
    EXPECT_FALSE(files[0].is_symlink);
    EXPECT_TRUE(fs::path(files[0].path).is_absolute());
}

TEST_F(FileScannerTest, GlobFiltersOnBaseName) {
    write_file("a.csv");
    write_file("b.json");
    write_file("c.txt");
    write_file("sub/d.csv");

    FileScanner scanner(test_dir, "*.{csv,json}", true, false);
    auto files = scanner.collect();

    EXPECT_EQ(names(files), (std::set<std::string>{"a.csv", "b.json", "sub/d.csv"}));
}

TEST_F(FileScannerTest, GlobMatchingNothingIsEmptyNotError) {
    write_file("a.txt");

    std::vector<ScanError> errors;
    FileScanner scanner(test_dir, "*.nomatch", true, false);
    auto files = scanner.collect(&errors);

    EXPECT_TRUE(files.empty());
    EXPECT_TRUE(errors.empty());
}

TEST_F(FileScannerTest, SymlinksSkippedUnlessFollowed) {
    auto target = write_file("real.txt");
    fs::create_symlink(target, test_dir / "link.txt");

    std::vector<ScanError> errors;
    auto plain = FileScanner(test_dir, "", false, false).collect(&errors);
    EXPECT_EQ(names(plain), (std::set<std::string>{"real.txt"}));
    EXPECT_TRUE(errors.empty());

    auto followed = FileScanner(test_dir, "", false, true).collect();
    EXPECT_EQ(names(followed), (std::set<std::string>{"real.txt", "link.txt"}));
    auto it = std::find_if(followed.begin(), followed.end(),
                           [](const FileRecord& f) { return f.name == "link.txt"; });
    ASSERT_NE(it, followed.end());
    EXPECT_TRUE(it->is_symlink);
}

TEST_F(FileScannerTest, SymlinkCycleDoesNotLoop) {
    write_file("dir/a.txt");
    fs::create_directory_symlink(test_dir / "dir", test_dir / "dir" / "loop");

    FileScanner scanner(test_dir, "", true, true);
    auto files = scanner.collect();

    EXPECT_EQ(names(files), (std::set<std::string>{"dir/a.txt"}));
}

TEST_F(FileScannerTest, ExcludedDirectoryIsNotEntered) {
    write_file("a.txt");
    write_file(".forager/uploaded_files.csv");

    FileScanner scanner(test_dir, "", true, false);
    scanner.exclude_dir(test_dir / ".forager");
    auto files = scanner.collect();

    EXPECT_EQ(names(files), (std::set<std::string>{"a.txt"}));
}

TEST_F(FileScannerTest, MissingRootReportsError) {
    std::vector<ScanError> errors;
    FileScanner scanner(test_dir / "nope", "", true, false);
    auto files = scanner.collect(&errors);

    EXPECT_TRUE(files.empty());
    ASSERT_EQ(errors.size(), 1u);
}

TEST_F(FileScannerTest, UnreadableSubtreeIsSkipped) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";

    write_file("ok/a.txt");
    write_file("locked/b.txt");
    fs::permissions(test_dir / "locked", fs::perms::none);

    std::vector<ScanError> errors;
    FileScanner scanner(test_dir, "", true, false);
    auto files = scanner.collect(&errors);

    fs::permissions(test_dir / "locked", fs::perms::owner_all);

    EXPECT_EQ(names(files), (std::set<std::string>{"ok/a.txt"}));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].path.find("locked"), std::string::npos);
}

TEST_F(FileScannerTest, RescanSeesNewFiles) {
    write_file("a.txt");
    FileScanner scanner(test_dir, "", false, false);
    EXPECT_EQ(scanner.collect().size(), 1u);

    write_file("b.txt");
    EXPECT_EQ(scanner.collect().size(), 2u);
}
