#include <gtest/gtest.h>

#include "helpers/ImagePicker.hpp"
#include "TestHelpers.hpp"

class ImagePickerTest : public ::testing::Test {
  protected:
    CTempDir         tmp;
    CRandomGenerator rng{1234};
};

TEST_F(ImagePickerTest, SmallImagesAreNeverPicked) {
    writeFile(tmp / "big.png", pngHeader(300, 300));
    writeFile(tmp / "small.png", pngHeader(100, 100));

    const std::vector<std::string> CANDIDATES = {tmp / "big.png", tmp / "small.png"};

    for (int i = 0; i < 200; ++i) {
        const auto PICKED = pickRandomImage(CANDIDATES, {.minWidth = 255, .minHeight = 255}, rng);
        ASSERT_TRUE(PICKED.has_value()) << PICKED.error();
        EXPECT_EQ(*PICKED, tmp / "big.png");
    }
}

TEST_F(ImagePickerTest, BothDimensionsMustFit) {
    writeFile(tmp / "wide.gif", gifHeader(1000, 10));

    EXPECT_FALSE(pickRandomImage({tmp / "wide.gif"}, {.minWidth = 255, .minHeight = 255, .maxAttempts = 5}, rng).has_value());
    EXPECT_TRUE(pickRandomImage({tmp / "wide.gif"}, {.minWidth = 255, .minHeight = 10, .maxAttempts = 5}, rng).has_value());
}

TEST_F(ImagePickerTest, UnknownDimensionsAreAccepted) {
    writeFile(tmp / "odd.jpg", "not really a jpeg but large enough to read");

    const auto PICKED = pickRandomImage({tmp / "odd.jpg"}, {.minWidth = 5000, .minHeight = 5000}, rng);
    ASSERT_TRUE(PICKED.has_value());
    EXPECT_EQ(*PICKED, tmp / "odd.jpg");
}

TEST_F(ImagePickerTest, MissingFilesAreNeverPicked) {
    writeFile(tmp / "real.png", pngHeader(400, 400));

    const std::vector<std::string> CANDIDATES = {tmp / "gone1.png", tmp / "real.png", tmp / "gone2.png"};

    for (int i = 0; i < 50; ++i) {
        const auto PICKED = pickRandomImage(CANDIDATES, {.minWidth = 1, .minHeight = 1}, rng);
        ASSERT_TRUE(PICKED.has_value());
        EXPECT_EQ(*PICKED, tmp / "real.png");
    }

    EXPECT_FALSE(pickRandomImage({tmp / "gone1.png"}, {}, rng).has_value());
}

TEST_F(ImagePickerTest, EmptyListFails) {
    EXPECT_FALSE(pickRandomImage({}, {}, rng).has_value());
}

TEST_F(ImagePickerTest, GivesUpAfterMaxAttempts) {
    writeFile(tmp / "tiny.png", pngHeader(1, 1));

    const auto PICKED = pickRandomImage({tmp / "tiny.png"}, {.minWidth = 2, .minHeight = 2, .maxAttempts = 3}, rng);
    ASSERT_FALSE(PICKED.has_value());
    EXPECT_TRUE(PICKED.error().contains("3 attempts"));
}
