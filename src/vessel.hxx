/*! \file vessel.hxx
 *  \brief vesselPhantom vessel header file
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

#ifndef __VESSEL_HXX__
#define __VESSEL_HXX__

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <vtkSmartPointer.h>
#include <vtkImageData.h>

#include "centerline.hxx"
#include "widthProfile.hxx"

// forward declaration
class vesselSeg;

// point in pixel space, x right and y down
typedef std::array<double,2> pixelPos;


/**********************************************
*
* structure for a branch socket at the end
* of a segment
*
**********************************************/
struct vesselEnd{
    // socket position (pixels)
    double pos[2];
    // outward direction (degrees)
    double angle;
    // offset from segment end direction (degrees)
    double offset;
    // already used as a child start
    bool consumed;
};


/**********************************************
*
* Class for a vessel tree on a fixed size canvas
*
**********************************************/

class vesselTree {

    friend class vesselSeg;

    // canvas size (pixels)
    int width, height;
    // every segment of the tree, in creation order
    std::vector<std::unique_ptr<vesselSeg>> segs;
    // take ownership of a new segment
    vesselSeg& adopt(std::unique_ptr<vesselSeg> seg);
public:
    // constructor, throws renderFailure for non-positive size
    vesselTree(int w, int h);
    // destructor, deletes all segments
    ~vesselTree();
    vesselTree(const vesselTree&) = delete;
    vesselTree& operator=(const vesselTree&) = delete;

    // new root segment, angles default to the direction posFrom -> posTo
    vesselSeg& addVessel(const pixelPos& posFrom, const pixelPos& posTo, double width,
        std::optional<double> angleFrom = std::nullopt,
        std::optional<double> angleTo = std::nullopt);
    // rasterized lumen, width x height x 1 unsigned char
    vtkSmartPointer<vtkImageData> getImage() const;

    int getWidth() const { return width; }
    int getHeight() const { return height; }
    std::size_t numSeg() const { return segs.size(); }
    vesselSeg& getSeg(std::size_t i);
    const vesselSeg& getSeg(std::size_t i) const;
};



/**********************************************
*
* Class for a vessel segment
*
**********************************************/

class vesselSeg {

    friend class vesselTree;

    // start and end position (pixels)
    double startPos[2];
    double endPos[2];
    // start and end direction (degrees)
    double startAngle, endAngle;
    // path from start to end
    centerline line;
    // width along the path
    widthProfile profile;
    // declared branch sockets
    std::vector<vesselEnd> ends;
    // pointer to owning tree
    vesselTree* myTree;
    // pointer to parent segment, nullptr for a root
    const vesselSeg* parent;
    // segments started at one of our ends
    std::vector<vesselSeg*> children;
    // replace the profile, children start at its end width
    void setProfile(const widthProfile& prof);
    // only the tree and parent segments create segments
    vesselSeg(vesselTree* tree, const vesselSeg* par, const double start[2], double startA,
        const double end[2], double endA, double startW, double endW);
public:
    // declare a socket at the segment end, returns its index
    unsigned int addEnd(double angleOffset);
    // new child segment starting at socket endIdx
    vesselSeg& appendVessel(unsigned int endIdx, const pixelPos& pos, double width,
        std::optional<double> angleTo = std::nullopt);
    // linear taper from start width to endWidth
    void taperTo(double endWidth);
    // localized stenosis
    void addNarrowing(double loc, double length, double scale);
    // centerline position at fractional arc length t
    pixelPos getProbePoint(double t) const;
    // full width at fractional arc length t
    double getWidth(double t) const;

    double getStartWidth() const { return profile.getStartWidth(); }
    double getEndWidth() const { return profile.getEndWidth(); }
    double getStartAngle() const { return startAngle; }
    double getEndAngle() const { return endAngle; }
    double getLength() const { return line.getLength(); }
    unsigned int numEnd() const { return ends.size(); }
    const vesselEnd& getEnd(unsigned int i) const;
    const vesselSeg* getParent() const { return parent; }
    const centerline& getCenterline() const { return line; }
    const widthProfile& getProfile() const { return profile; }
};

#endif /* __VESSEL_HXX__ */
