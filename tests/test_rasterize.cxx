/*! \file test_rasterize.cxx
 *  \brief vesselPhantom rasterize tests
 *  \author vesselPhantom contributors
 *  \version 1.0
 *  \date 2026
 *
 *  \copyright To the extent possible under law, the author(s) have
 *  dedicated all copyright and related and neighboring rights to this
 *  software to the public domain worldwide. This software is
 *  distributed without any warranty.  You should have received a copy
 *  of the CC0 Public Domain Dedication along with this software.
 *  If not, see <http://creativecommons.org/publicdomain/zero/1.0/>.
 *
 */

#include <gtest/gtest.h>

#include <cstring>

#include <vtkImageData.h>
#include <vtkSmartPointer.h>
#include <vtkType.h>

#include "intensity.hxx"
#include "rasterize.hxx"
#include "vessel.hxx"
#include "test_helpers.hxx"

using test_utils::columnCoverage;
using test_utils::pixel;
using test_utils::pixelAt;
using test_utils::rowCoverage;

// === BUFFER CONTRACT ===

TEST(RasterizeTest, ImageShapeAndType) {
    vesselTree tree(120, 45);
    tree.addVessel({0.0, 20.0}, {120.0, 20.0}, 6.0);
    auto image = tree.getImage();

    int dim[3];
    image->GetDimensions(dim);
    EXPECT_EQ(dim[0], 120);
    EXPECT_EQ(dim[1], 45);
    EXPECT_EQ(dim[2], 1);
    EXPECT_EQ(image->GetScalarType(), VTK_UNSIGNED_CHAR);
    EXPECT_EQ(image->GetNumberOfScalarComponents(), 1);
}

TEST(RasterizeTest, EmptyTreeIsBackground) {
    vesselTree tree(32, 16);
    auto image = tree.getImage();

    for (int j = 0; j < 16; ++j) {
        for (int i = 0; i < 32; ++i) {
            EXPECT_EQ(pixel(image, i, j), intensity::bg);
        }
    }
}

TEST(RasterizeTest, RepeatedRenderIsIdentical) {
    vesselTree tree(200, 100);
    vesselSeg& root = tree.addVessel({0.0, 50.0}, {60.0, 50.0}, 12.0);
    vesselSeg& child = root.appendVessel(root.addEnd(25.0), {200.0, 90.0}, 8.0);
    child.addNarrowing(0.5, 0.3, 0.4);

    auto first = tree.getImage();
    auto second = tree.getImage();

    const auto bytes = static_cast<std::size_t>(200 * 100);
    EXPECT_EQ(std::memcmp(first->GetScalarPointer(), second->GetScalarPointer(), bytes), 0);
}

// === TUBE SHAPE ===

TEST(RasterizeTest, StraightTubeWidth) {
    vesselTree tree(200, 100);
    tree.addVessel({20.0, 50.0}, {180.0, 50.0}, 16.0);
    auto image = tree.getImage();

    EXPECT_NEAR(columnCoverage(image, 100), 16.0, 0.5);
    EXPECT_EQ(pixel(image, 100, 50), intensity::lumen);
    EXPECT_EQ(pixel(image, 100, 30), intensity::bg);
    EXPECT_EQ(pixel(image, 5, 50), intensity::bg);
}

TEST(RasterizeTest, OffGridTubeWidth) {
    vesselTree tree(100, 200);
    tree.addVessel({40.3, 10.0}, {40.3, 190.0}, 9.0);
    auto image = tree.getImage();

    EXPECT_NEAR(rowCoverage(image, 100), 9.0, 0.5);
}

TEST(RasterizeTest, EdgesAreAntialiased) {
    vesselTree tree(100, 100);
    tree.addVessel({10.0, 50.0}, {90.0, 50.0}, 16.0);
    auto image = tree.getImage();

    // boundary at y = 42 and y = 58 falls on pixel centers
    EXPECT_GT(pixel(image, 50, 42), intensity::bg);
    EXPECT_LT(pixel(image, 50, 42), intensity::lumen);
    EXPECT_GT(pixel(image, 50, 58), intensity::bg);
    EXPECT_LT(pixel(image, 50, 58), intensity::lumen);
}

TEST(RasterizeTest, JoinIsSeamless) {
    vesselTree tree(200, 100);
    vesselSeg& root = tree.addVessel({0.0, 50.0}, {100.0, 50.0}, 16.0);
    root.appendVessel(root.addEnd(0.0), {200.0, 50.0}, 16.0);
    auto image = tree.getImage();

    // overlapping caps render like one tube
    for (int i = 90; i <= 110; ++i) {
        EXPECT_NEAR(columnCoverage(image, i), 16.0, 0.5);
    }
}

TEST(RasterizeTest, JoinStaysSeamlessAfterParentTaper) {
    vesselTree tree(200, 100);
    vesselSeg& root = tree.addVessel({0.0, 50.0}, {100.0, 50.0}, 16.0);
    root.appendVessel(root.addEnd(0.0), {200.0, 50.0}, 8.0);
    root.taperTo(8.0);
    auto image = tree.getImage();

    for (int i = 96; i <= 110; ++i) {
        EXPECT_NEAR(columnCoverage(image, i), 8.0, 0.5);
    }
}

TEST(RasterizeTest, GeometryOutsideCanvasIsClipped) {
    vesselTree tree(100, 50);
    tree.addVessel({-50.0, 25.0}, {300.0, 25.0}, 10.0);
    tree.addVessel({50.0, -100.0}, {50.0, -20.0}, 10.0);
    auto image = tree.getImage();

    EXPECT_EQ(pixel(image, 0, 25), intensity::lumen);
    EXPECT_EQ(pixel(image, 99, 25), intensity::lumen);
    EXPECT_EQ(pixel(image, 50, 0), intensity::bg);
}

TEST(RasterizeTest, OverlappingNarrowingsRender) {
    vesselTree tree(200, 60);
    vesselSeg& seg = tree.addVessel({0.0, 30.0}, {200.0, 30.0}, 20.0);
    seg.addNarrowing(0.5, 0.4, 0.5);
    seg.addNarrowing(0.55, 0.4, 0.5);
    auto image = tree.getImage();

    EXPECT_LT(columnCoverage(image, 105), columnCoverage(image, 20));
    EXPECT_EQ(pixel(image, 105, 30), intensity::lumen);
}

// === END TO END ===

TEST(RasterizeTest, NarrowedBifurcationScenario) {
    vesselTree tree(400, 160);
    vesselSeg& root = tree.addVessel({0.0, 80.0}, {80.0, 80.0}, 16.0);
    root.addEnd(30.0);
    const unsigned int straight = root.addEnd(0.0);
    root.addEnd(-30.0);
    vesselSeg& child = root.appendVessel(straight, {400.0, 80.0}, 16.0);
    child.addNarrowing(0.5, 0.4, 0.3);
    auto image = tree.getImage();

    // lumen is continuous along the axis
    for (int i = 0; i < 400; ++i) {
        EXPECT_EQ(pixel(image, i, 80), intensity::lumen) << "gap at x=" << i;
    }

    // full width before the narrowing, 0.3 of it at its center
    EXPECT_NEAR(columnCoverage(image, 40), 16.0, 0.5);
    EXPECT_NEAR(columnCoverage(image, 150), 16.0, 0.5);
    EXPECT_NEAR(columnCoverage(image, 240), 16.0 * 0.3, 0.5);
    EXPECT_LT(columnCoverage(image, 240), columnCoverage(image, 200));

    const pixelPos mid = child.getProbePoint(0.5);
    EXPECT_NEAR(mid[0], 240.0, 1e-6);
    EXPECT_NEAR(mid[1], 80.0, 1e-6);
    EXPECT_EQ(pixelAt(image, mid[0], mid[1]), intensity::lumen);
    EXPECT_LT(child.getWidth(0.5), child.getWidth(0.0));
}

// === SAMPLING ===

TEST(RasterizeTest, TubeDistanceAndCoverage) {
    vesselTree tree(100, 100);
    vesselSeg& seg = tree.addVessel({10.0, 50.0}, {90.0, 50.0}, 10.0);
    const tubeSamples tube = sampleTube(seg);

    EXPECT_GE(tube.x.size(), 161u);
    EXPECT_NEAR(tubeDistance(tube, 50.0, 50.0), -5.0, 1e-9);
    EXPECT_NEAR(tubeDistance(tube, 50.0, 60.0), 5.0, 1e-9);
    EXPECT_NEAR(tubeDistance(tube, 0.0, 50.0), 5.0, 1e-9);
    EXPECT_NEAR(tube.bounds[0], 5.0, 1e-9);
    EXPECT_NEAR(tube.bounds[3], 55.0, 1e-9);

    EXPECT_DOUBLE_EQ(pixelCoverage(0.0), 0.5);
    EXPECT_DOUBLE_EQ(pixelCoverage(-3.0), 1.0);
    EXPECT_DOUBLE_EQ(pixelCoverage(3.0), 0.0);
}

TEST(RasterizeTest, RowCullingKeepsNearbyPieces) {
    vesselTree tree(200, 200);
    vesselSeg& seg = tree.addVessel({0.0, 0.0}, {200.0, 200.0}, 8.0);
    const tubeSamples tube = sampleTube(seg);
    const double pad = 1.0;

    const auto pieces = rowPieces(tube, 100.0, pad);
    ASSERT_FALSE(pieces.empty());
    EXPECT_LT(pieces.size(), tube.x.size()/10);
    EXPECT_TRUE(rowPieces(tube, 300.0, pad).empty());

    // same answer wherever the pixel can be covered
    for (int i = 80; i <= 120; ++i) {
        const double full = tubeDistance(tube, i, 100.0);
        if (full <= pad) {
            EXPECT_DOUBLE_EQ(tubeDistance(tube, pieces, i, 100.0), full) << i;
        } else {
            EXPECT_GT(tubeDistance(tube, pieces, i, 100.0), pad) << i;
        }
    }
}
