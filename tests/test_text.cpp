#include <gtest/gtest.h>
#include "io/text_loader.hpp"
#include "text/text_cleaner.hpp"

#include <filesystem>
#include <stdexcept>

using namespace infocode;

TEST(TextCleanerTest, StripsSpacesAndPunctuation) {
    EXPECT_EQ(clean_text("Hello, world! (ok)"), "Helloworldok");
    EXPECT_EQ(clean_text("a-b_c.d;e:f'g\"h"), "abcdefgh");
}

TEST(TextCleanerTest, KeepsNewlinesAndNonAscii) {
    EXPECT_EQ(clean_text("line one.\nline\ttwo"), "lineone\nline\ttwo");
    // "Привет, мир!"
    EXPECT_EQ(clean_text("\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82, \xD0\xBC\xD0\xB8\xD1\x80!"),
              "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82\xD0\xBC\xD0\xB8\xD1\x80");
}

TEST(TextCleanerTest, EmptyAndAllPunctuation) {
    EXPECT_EQ(clean_text(""), "");
    EXPECT_EQ(clean_text(" !?. "), "");
}

class TextLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "infocode_text_loader_test.txt").string();
    }

    void TearDown() override {
        if (std::filesystem::exists(path_)) {
            std::filesystem::remove(path_);
        }
    }

    std::string path_;
};

TEST_F(TextLoaderTest, SaveThenLoad) {
    const std::string text = "abra\ncadabra\r\n\xD0\xBC";
    save_text(path_, text);
    EXPECT_EQ(load_text(path_), text);
}

TEST_F(TextLoaderTest, MissingFile) {
    EXPECT_THROW(load_text(path_ + ".does-not-exist"), std::runtime_error);
}
