/*! \file rasterize.hxx
 *  \brief vesselPhantom rasterization header file
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

#ifndef __RASTERIZE_HXX__
#define __RASTERIZE_HXX__

#include <cstddef>
#include <vector>

#include <vtkSmartPointer.h>
#include <vtkImageData.h>

class vesselSeg;
class vesselTree;

// maximum centerline sample spacing (pixels)
const double maxSampleStep = 0.5;
// minimum number of pieces per segment
const unsigned int minSamplePieces = 16;

/**********************************************
*
* structure for a sampled tube, centerline
* points with the local half width
*
**********************************************/
struct tubeSamples{
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> r;
    // xmin, xmax, ymin, ymax including radius
    double bounds[4];
};

// sample centerline and half width at uniform arc length steps
tubeSamples sampleTube(const vesselSeg& seg);

// distance from (px,py) to the swept tube, negative inside
double tubeDistance(const tubeSamples& tube, double px, double py);

// pieces of the tube reaching within pad of row py
std::vector<std::size_t> rowPieces(const tubeSamples& tube, double py, double pad);

// distance over the given pieces only
double tubeDistance(const tubeSamples& tube, const std::vector<std::size_t>& pieces,
    double px, double py);

// fraction of a pixel covered at signed distance d
double pixelCoverage(double d);

// render the union of all segment tubes, pixel (i,j) centered at x=i, y=j
vtkSmartPointer<vtkImageData> rasterizeTree(const vesselTree& tree);

#endif /* __RASTERIZE_HXX__ */
