#include <gtest/gtest.h>

#include <sys/stat.h>

#include "artifact_store.hpp"
#include "errors.hpp"
#include "fakes.hpp"

TEST(ArtifactStoreTest, NameEmbedsSecondResolutionTimestamp) {
    TempDir dir;
    FakeClock clock;
    std::string path = artifact_path(dir.path, clock.now());
    EXPECT_EQ(path, dir.path + "/status_20250115_090000.png");
}

TEST(ArtifactStoreTest, WritesBytesAndLeavesNoTemporaryFile) {
    TempDir dir;
    std::string path = dir.path + "/status_20250115_090000.png";
    std::vector<unsigned char> bytes = {'P', 'N', 'G', 'D', 'A', 'T', 'A'};

    write_artifact(path, bytes);

    EXPECT_EQ(read_file(path), "PNGDATA");
    std::vector<std::string> files = list_files(dir.path);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], "status_20250115_090000.png");
}

TEST(ArtifactStoreTest, TakenNameGetsSuffix) {
    TempDir dir;
    FakeClock clock;
    std::string first = artifact_path(dir.path, clock.now());
    write_artifact(first, std::vector<unsigned char>{'a'});

    std::string second = artifact_path(dir.path, clock.now());
    EXPECT_EQ(second, dir.path + "/status_20250115_090000_1.png");
    write_artifact(second, std::vector<unsigned char>{'b'});

    EXPECT_EQ(read_file(first), "a");
    EXPECT_EQ(read_file(second), "b");
}

TEST(ArtifactStoreTest, UnwritableDirectoryIsPersistError) {
    TempDir dir;
    std::string path = dir.path + "/missing/status_20250115_090000.png";

    EXPECT_THROW(write_artifact(path, std::vector<unsigned char>{'x'}), PersistError);
    EXPECT_TRUE(list_files(dir.path).empty());
}

TEST(ArtifactStoreTest, CreateDirMakesParentsWithMode0755) {
    TempDir dir;
    std::string nested = dir.path + "/home/me/Screenshots";
    ASSERT_TRUE(create_dir(nested, 0755));
    EXPECT_TRUE(create_dir(nested, 0755));

    struct stat st;
    ASSERT_EQ(stat(nested.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(st.st_mode & S_IRWXU, static_cast<mode_t>(S_IRWXU));
}
