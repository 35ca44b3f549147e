#include "lib/iso_inspector.hpp"
#include "lib/errors.hpp"
#include "test_helpers.hpp"
#include <fstream>

namespace fs = std::filesystem;

class ISOInspectorTest : public TestHelpers::ScratchTest {};

TEST_F(ISOInspectorTest, DetectsHybrid) {
    fs::path image = dir() / "hybrid.iso";
    TestHelpers::writeFakeImage(image);
    
    ISOInspector::ImageInfo info = ISOInspector::inspect(image.string());
    
    EXPECT_EQ(info.size, 40u * 1024);
    EXPECT_TRUE(info.hasISO9660);
    EXPECT_TRUE(info.hasMBRSignature);
    EXPECT_TRUE(info.hasPartitions);
    EXPECT_EQ(info.type, ISOInspector::ImageType::HYBRID);
}

TEST_F(ISOInspectorTest, DetectsElTorito) {
    fs::path image = dir() / "cd.iso";
    std::string data(40 * 1024, '\0');
    data.replace(32769, 5, "CD001");
    data.replace(34816 + 7, 9, "EL TORITO");
    TestHelpers::writeText(image, data);
    
    ISOInspector::ImageInfo info = ISOInspector::inspect(image.string());
    
    EXPECT_TRUE(info.hasElTorito);
    EXPECT_FALSE(info.hasMBRSignature);
    EXPECT_EQ(info.type, ISOInspector::ImageType::EL_TORITO);
}

TEST_F(ISOInspectorTest, UnknownForRandomData) {
    fs::path image = dir() / "junk.img";
    TestHelpers::writeText(image, std::string(1000, 'z'));
    
    EXPECT_EQ(ISOInspector::inspect(image.string()).type, ISOInspector::ImageType::UNKNOWN);
}

TEST_F(ISOInspectorTest, MissingImage) {
    EXPECT_THROW(ISOInspector::inspect((dir() / "none.iso").string()), NotFoundError);
}
