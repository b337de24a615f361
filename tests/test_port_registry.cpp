#include "test_helpers.hpp"
#include <instance/port_registry.hpp>
#include <fstream>

class PortRegistryTest : public ScratchDirTest {
protected:
    fs::path port_path() const { return dir / "app.port"; }

    void write_raw(const std::string& content) {
        std::ofstream(port_path()) << content;
    }
};

TEST_F(PortRegistryTest, MissingFileReadsAsAbsent) {
    PortRegistry reg(port_path());
    EXPECT_FALSE(reg.read().has_value());
}

TEST_F(PortRegistryTest, PublishThenRead) {
    PortRegistry reg(port_path());
    ASSERT_TRUE(reg.publish(43127).is_ok());
    EXPECT_EQ(reg.read(), std::optional<int>(43127));

    std::ifstream in(port_path());
    std::string content;
    in >> content;
    EXPECT_EQ(content, "43127");
}

TEST_F(PortRegistryTest, PublishOverwritesPreviousValue) {
    PortRegistry reg(port_path());
    ASSERT_TRUE(reg.publish(50000).is_ok());
    ASSERT_TRUE(reg.publish(8).is_ok());
    EXPECT_EQ(reg.read(), std::optional<int>(8));
}

TEST_F(PortRegistryTest, SurroundingWhitespaceIsTrimmed) {
    write_raw("  4242\n");
    EXPECT_EQ(PortRegistry(port_path()).read(), std::optional<int>(4242));
}

TEST_F(PortRegistryTest, GarbageReadsAsAbsent) {
    PortRegistry reg(port_path());
    for (const char* junk : {"", "abc", "42abc", "4 2", "0x50"}) {
        write_raw(junk);
        EXPECT_FALSE(reg.read().has_value()) << "content: '" << junk << "'";
    }
}

// Partial write left behind by an interrupted publish
TEST_F(PortRegistryTest, TornWriteReadsAsAbsent) {
    write_raw("43");
    EXPECT_EQ(PortRegistry(port_path()).read(), std::optional<int>(43));
    write_raw("-");
    EXPECT_FALSE(PortRegistry(port_path()).read().has_value());
}

TEST_F(PortRegistryTest, OutOfRangeReadsAsAbsent) {
    PortRegistry reg(port_path());
    for (const char* bad : {"0", "-5", "65535", "70000", "99999999999999999999"}) {
        write_raw(bad);
        EXPECT_FALSE(reg.read().has_value()) << "content: '" << bad << "'";
    }
    write_raw("1");
    EXPECT_EQ(reg.read(), std::optional<int>(1));
    write_raw("65534");
    EXPECT_EQ(reg.read(), std::optional<int>(65534));
}

TEST_F(PortRegistryTest, PublishRejectsInvalidPort) {
    PortRegistry reg(port_path());
    EXPECT_TRUE(reg.publish(0).is_err());
    EXPECT_TRUE(reg.publish(65535).is_err());
    EXPECT_FALSE(fs::exists(port_path()));
}

TEST_F(PortRegistryTest, PublishFailsWhenPathIsUnwritable) {
    fs::create_directories(port_path());
    PortRegistry reg(port_path());
    auto r = reg.publish(1234);
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(r.error.empty());
}

TEST_F(PortRegistryTest, ClearRemovesFile) {
    PortRegistry reg(port_path());
    ASSERT_TRUE(reg.publish(1234).is_ok());
    reg.clear();
    EXPECT_FALSE(fs::exists(port_path()));
    EXPECT_FALSE(reg.read().has_value());
}

TEST_F(PortRegistryTest, ClearWithoutFileIsNoop) {
    PortRegistry reg(port_path());
    reg.clear();
    reg.clear();
    EXPECT_FALSE(fs::exists(port_path()));
}
