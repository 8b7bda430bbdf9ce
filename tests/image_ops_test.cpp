#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <cstdio>
#include <filesystem>

#include "test_helpers.hpp"
#include "util/Errors.hpp"
#include "util/ImageOps.hpp"

using namespace alphapunch;
using alphapunch::test_support::solidPng;

namespace {

    // A 6x4 JPEG whose EXIF says "rotate 90 CW to display" (Orientation = 6).
    Bytes rotatedJpeg()
    {
        cv::Mat bgr(4, 6, CV_8UC3, cv::Scalar(40, 90, 160));
        std::vector<unsigned char> jpg;
        if (!cv::imencode(".jpg", bgr, jpg)) return {};

        const Bytes app1{
            0xFF, 0xE1, 0x00, 0x22,                   // APP1, length 34
            'E', 'x', 'i', 'f', 0x00, 0x00,
            'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08, // big-endian TIFF, IFD0 at 8
            0x00, 0x01,                               // one entry
            0x01, 0x12, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x06, 0x00, 0x00,
            0x00, 0x00, 0x00, 0x00};                  // no next IFD
        Bytes out(jpg.begin(), jpg.begin() + 2);      // SOI
        out.insert(out.end(), app1.begin(), app1.end());
        out.insert(out.end(), jpg.begin() + 2, jpg.end());
        return out;
    }

}

TEST(ImageOps, DecodeBgrJpegGivesOpaqueRgba)
{
    cv::Mat bgr(4, 6, CV_8UC3, cv::Scalar(255, 0, 0)); // blue in BGR
    std::vector<unsigned char> jpg;
    ASSERT_TRUE(cv::imencode(".jpg", bgr, jpg));

    cv::Mat rgba = util::decodeRgba(jpg);
    ASSERT_EQ(rgba.type(), CV_8UC4);
    EXPECT_EQ(rgba.cols, 6);
    EXPECT_EQ(rgba.rows, 4);
    cv::Vec4b px = rgba.at<cv::Vec4b>(2, 3);
    EXPECT_LT(px[0], 20);
    EXPECT_GT(px[2], 230);
    EXPECT_EQ(px[3], 255);
}

TEST(ImageOps, DecodeGrayscale)
{
    cv::Mat gray(3, 3, CV_8UC1, cv::Scalar(77));
    std::vector<unsigned char> png;
    ASSERT_TRUE(cv::imencode(".png", gray, png));
    cv::Mat rgba = util::decodeRgba(png);
    EXPECT_EQ(rgba.at<cv::Vec4b>(1, 1), cv::Vec4b(77, 77, 77, 255));
}

TEST(ImageOps, Decode16BitPng)
{
    cv::Mat deep(2, 2, CV_16UC3, cv::Scalar(65535, 0, 0));
    std::vector<unsigned char> png;
    ASSERT_TRUE(cv::imencode(".png", deep, png));
    cv::Mat rgba = util::decodeRgba(png);
    ASSERT_EQ(rgba.type(), CV_8UC4);
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 255, 255));
}

TEST(ImageOps, DecodeErrors)
{
    EXPECT_THROW(util::decodeRgba(Bytes{}), DecodeError);
    EXPECT_THROW(util::decodeRgba(Bytes{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'}), DecodeError);
}

TEST(ImageOps, PngKeepsChannelOrder)
{
    Bytes png = solidPng(2, 2, cv::Vec4b(10, 20, 30, 40));
    EXPECT_EQ(util::decodeRgba(png).at<cv::Vec4b>(0, 0), cv::Vec4b(10, 20, 30, 40));
}

TEST(ImageOps, EncodeRejectsEmpty)
{
    EXPECT_THROW(util::encodePng(cv::Mat()), EncodeError);
}

TEST(ImageOps, ProbeSize)
{
    auto dims = util::probeSize(solidPng(13, 7, cv::Vec4b(0, 0, 0, 255)));
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, Dimensions(13, 7));
    EXPECT_FALSE(util::probeSize(Bytes{1, 2, 3}).has_value());
    EXPECT_FALSE(util::probeSize(Bytes{}).has_value());
}

TEST(ImageOps, ProbeSizeHonorsExifOrientation)
{
    Bytes jpg = rotatedJpeg();
    ASSERT_FALSE(jpg.empty());
    auto dims = util::probeSize(jpg);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, Dimensions(4, 6));
}

TEST(ImageOps, DecodeRotatesExifJpegUpright)
{
    cv::Mat rgba = util::decodeRgba(rotatedJpeg());
    ASSERT_EQ(rgba.type(), CV_8UC4);
    EXPECT_EQ(rgba.cols, 4);
    EXPECT_EQ(rgba.rows, 6);
    EXPECT_EQ(rgba.at<cv::Vec4b>(0, 0)[3], 255);
}

TEST(ImageOps, SniffMimeType)
{
    EXPECT_EQ(util::sniffMimeType(solidPng(1, 1, cv::Vec4b(0, 0, 0, 0))), "image/png");
    EXPECT_EQ(util::sniffMimeType(Bytes{0xFF, 0xD8, 0xFF, 0xE0}), "image/jpeg");
    Bytes webp{'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'};
    EXPECT_EQ(util::sniffMimeType(webp), "image/webp");
    EXPECT_EQ(util::sniffMimeType(Bytes{'x'}), "application/octet-stream");
    EXPECT_EQ(util::extensionForMime("image/jpeg"), ".jpg");
    EXPECT_EQ(util::extensionForMime("whatever"), ".png");
}

TEST(ImageOps, ThumbnailFitsLongestSide)
{
    Bytes big = solidPng(200, 100, cv::Vec4b(0, 255, 0, 0));
    Bytes thumb = util::makeThumbnail(big, 50);
    auto dims = util::probeSize(thumb);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, Dimensions(50, 25));
    EXPECT_EQ(util::decodeRgba(thumb).at<cv::Vec4b>(10, 10)[3], 0);
}

TEST(ImageOps, ThumbnailPassThrough)
{
    Bytes small = solidPng(20, 10, cv::Vec4b(1, 2, 3, 4));
    EXPECT_EQ(util::makeThumbnail(small, 50), small);
    EXPECT_EQ(util::makeThumbnail(small, 0), small);
    Bytes junk{9, 9, 9};
    EXPECT_EQ(util::makeThumbnail(junk, 5), junk);
}

TEST(ImageOps, FileRoundTrip)
{
    auto path = (std::filesystem::temp_directory_path() / "alphapunch_image_ops_test.bin").string();
    Bytes data{0, 1, 2, 250, 255};
    ASSERT_TRUE(util::writeFile(path, data));
    EXPECT_EQ(util::readFile(path), data);
    std::remove(path.c_str());
    EXPECT_TRUE(util::readFile(path).empty());
}
