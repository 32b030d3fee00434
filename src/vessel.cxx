/*! \file vessel.cxx
 *  \brief vesselPhantom vessel tree and segments
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

#include "vessel.hxx"

#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <vtkMath.h>

#include "rasterize.hxx"
#include "vesselErrors.hxx"


// direction from a to b (degrees)
static double lineAngle(const double a[2], const double b[2]){
    return vtkMath::DegreesFromRadians(std::atan2(b[1]-a[1], b[0]-a[0]));
}


static void checkPoint(const double p[2]){
    if(!std::isfinite(p[0]) || !std::isfinite(p[1])){
        throw invalidGeometry(fmt::format("vessel point ({}, {}) is not finite", p[0], p[1]));
    }
}


static void checkAngle(const std::optional<double>& angle){
    if(angle && !std::isfinite(*angle)){
        throw invalidGeometry("vessel angle is not finite");
    }
}


/**********************************************
*
* vesselTree
*
**********************************************/

vesselTree::vesselTree(int w, int h){
    if(w <= 0 || h <= 0){
        throw renderFailure(fmt::format("canvas size {}x{} must be positive", w, h));
    }
    width = w;
    height = h;
}


vesselTree::~vesselTree() = default;


vesselSeg& vesselTree::adopt(std::unique_ptr<vesselSeg> seg){
    segs.push_back(std::move(seg));
    return *segs.back();
}


vesselSeg& vesselTree::addVessel(const pixelPos& posFrom, const pixelPos& posTo, double width,
    std::optional<double> angleFrom, std::optional<double> angleTo){

    checkPoint(posFrom.data());
    checkPoint(posTo.data());
    checkAngle(angleFrom);
    checkAngle(angleTo);
    if(posFrom == posTo){
        throw invalidGeometry(fmt::format("vessel start and end coincide at ({}, {})",
            posFrom[0], posFrom[1]));
    }

    // straight line direction unless given
    const double straight = lineAngle(posFrom.data(), posTo.data());
    const double a0 = angleFrom.value_or(straight);
    const double a1 = angleTo.value_or(straight);

    auto seg = std::unique_ptr<vesselSeg>(new vesselSeg(this, nullptr,
        posFrom.data(), a0, posTo.data(), a1, width, width));

    spdlog::debug("Root segment {}: ({}, {}) -> ({}, {}), width {}", segs.size(),
        posFrom[0], posFrom[1], posTo[0], posTo[1], width);

    return adopt(std::move(seg));
}


vtkSmartPointer<vtkImageData> vesselTree::getImage() const {
    return rasterizeTree(*this);
}


vesselSeg& vesselTree::getSeg(std::size_t i){
    if(i >= segs.size()){
        throw outOfRange(fmt::format("segment index {} but tree has {} segments", i, segs.size()));
    }
    return *segs[i];
}


const vesselSeg& vesselTree::getSeg(std::size_t i) const {
    if(i >= segs.size()){
        throw outOfRange(fmt::format("segment index {} but tree has {} segments", i, segs.size()));
    }
    return *segs[i];
}


/**********************************************
*
* vesselSeg
*
**********************************************/

vesselSeg::vesselSeg(vesselTree* tree, const vesselSeg* par, const double start[2], double startA,
    const double end[2], double endA, double startW, double endW) :
    line(start, startA, end, endA),
    profile(startW, endW),
    myTree(tree),
    parent(par)
{
    for(int i=0; i<2; i++){
        startPos[i] = start[i];
        endPos[i] = end[i];
    }
    startAngle = startA;
    endAngle = endA;
}


unsigned int vesselSeg::addEnd(double angleOffset){
    if(!std::isfinite(angleOffset)){
        throw invalidGeometry("end angle offset is not finite");
    }

    vesselEnd e;
    e.pos[0] = endPos[0];
    e.pos[1] = endPos[1];
    e.angle = endAngle + angleOffset;
    e.offset = angleOffset;
    e.consumed = false;
    ends.push_back(e);

    return ends.size()-1;
}


const vesselEnd& vesselSeg::getEnd(unsigned int i) const {
    if(i >= ends.size()){
        throw outOfRange(fmt::format("end index {} but segment has {} ends", i, ends.size()));
    }
    return ends[i];
}


vesselSeg& vesselSeg::appendVessel(unsigned int endIdx, const pixelPos& pos, double width,
    std::optional<double> angleTo){

    if(endIdx >= ends.size()){
        throw invalidGeometry(fmt::format("unknown end {}, segment has {} ends", endIdx, ends.size()));
    }
    vesselEnd& e = ends[endIdx];
    if(e.consumed){
        throw invalidGeometry(fmt::format("end {} already has a child segment", endIdx));
    }
    checkPoint(pos.data());
    checkAngle(angleTo);
    if(e.pos[0] == pos[0] && e.pos[1] == pos[1]){
        throw invalidGeometry(fmt::format("child end coincides with end {} at ({}, {})",
            endIdx, pos[0], pos[1]));
    }

    // start width continues the local width of this segment
    const double startW = getWidth(1.0);
    if(!(startW > 0.0)){
        throw invalidGeometry(fmt::format("segment is closed at its end (width {}), "
            "cannot start a child at end {}", startW, endIdx));
    }
    const double a1 = angleTo.value_or(lineAngle(e.pos, pos.data()));

    auto seg = std::unique_ptr<vesselSeg>(new vesselSeg(myTree, this,
        e.pos, e.angle, pos.data(), a1, startW, width));

    spdlog::debug("Child segment {} at end {} ({:+} deg): ({}, {}) -> ({}, {}), width {} -> {}",
        myTree->segs.size(), endIdx, e.offset, e.pos[0], e.pos[1], pos[0], pos[1], startW, width);

    children.reserve(children.size()+1);
    vesselSeg& child = myTree->adopt(std::move(seg));
    children.push_back(&child);
    e.consumed = true;
    return child;
}


void vesselSeg::setProfile(const widthProfile& prof){
    const double endW = prof.getWidth(1.0);
    if(!children.empty() && !(endW > 0.0)){
        throw invalidGeometry(fmt::format("segment end would close (width {}) "
            "but {} child segments start there", endW, children.size()));
    }
    profile = prof;
    for(vesselSeg* c : children){
        c->profile.setStartWidth(endW);
    }
}


void vesselSeg::taperTo(double endWidth){
    widthProfile prof = profile;
    prof.taperTo(endWidth);
    setProfile(prof);
}


void vesselSeg::addNarrowing(double loc, double length, double scale){
    widthProfile prof = profile;
    prof.addNarrowing(loc, length, scale);
    setProfile(prof);
}


pixelPos vesselSeg::getProbePoint(double t) const {
    if(!(t >= 0.0 && t <= 1.0)){
        throw outOfRange(fmt::format("probe parameter {} outside [0,1]", t));
    }
    pixelPos p;
    line.getPoint(t, p.data());
    return p;
}


double vesselSeg::getWidth(double t) const {
    if(!(t >= 0.0 && t <= 1.0)){
        throw outOfRange(fmt::format("width parameter {} outside [0,1]", t));
    }
    return profile.getWidth(t);
}
