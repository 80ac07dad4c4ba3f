#include <core/known_devices.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace accessory;
namespace fs = std::filesystem;

namespace {

class KnownDevicesTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("accessory-") + info->name());
        fs::remove_all(dir);
        path = (dir / "config" / "known_devices").string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path dir;
    std::string path;
};

} // namespace

TEST_F(KnownDevicesTest, MissingFileIsEmpty) {
    FileKnownDeviceStore store(path);

    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(store.exists(1));
    EXPECT_FALSE(store.get(1).has_value());
}

TEST_F(KnownDevicesTest, EntriesPersistAcrossInstances) {
    {
        FileKnownDeviceStore store(path);
        store.set(388131615u, "Keys");
        store.set(7, "Bag");
        EXPECT_TRUE(fs::exists(path));
    }

    FileKnownDeviceStore reloaded(path);
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_EQ(reloaded.get(388131615u), "Keys");
    EXPECT_EQ(reloaded.get(7), "Bag");
}

TEST_F(KnownDevicesTest, SetReplacesName) {
    FileKnownDeviceStore store(path);
    store.set(7, "Bag");
    store.set(7, "Backpack");

    FileKnownDeviceStore reloaded(path);
    EXPECT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.get(7), "Backpack");
}

TEST_F(KnownDevicesTest, ClearPersists) {
    {
        FileKnownDeviceStore store(path);
        store.set(7, "Bag");
        store.clear();
        EXPECT_FALSE(store.exists(7));
    }

    FileKnownDeviceStore reloaded(path);
    EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(KnownDevicesTest, NamesStayOnOneLine) {
    {
        FileKnownDeviceStore store(path);
        store.set(7, "two\nlines\tand tab");
    }

    FileKnownDeviceStore reloaded(path);
    EXPECT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.get(7), "two lines and tab");
}

TEST_F(KnownDevicesTest, MalformedLinesAreSkipped) {
    fs::create_directories(fs::path(path).parent_path());
    {
        std::ofstream out(path);
        out << "12\tGood\n"
            << "no tab here\n"
            << "abc\tBad id\n"
            << "\n"
            << "34\tAlso good\n";
    }

    FileKnownDeviceStore store(path);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get(12), "Good");
    EXPECT_EQ(store.get(34), "Also good");
}
