/*! \file widthProfile.cxx
 *  \brief vesselPhantom width profile
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

#include "widthProfile.hxx"

#include <cmath>

#include <fmt/format.h>
#include <vtkMath.h>

#include "vesselErrors.hxx"


static bool inUnitInterval(double v){
    return v >= 0.0 && v <= 1.0;
}


static void checkWidth(double w){
    if(!(w > 0.0) || !std::isfinite(w)){
        throw invalidGeometry(fmt::format("vessel width must be positive, got {}", w));
    }
}


double narrowing::factor(double t) const {
    const double halfLen = 0.5*length;
    const double dist = std::fabs(t - loc);
    if(halfLen <= 0.0 || dist >= halfLen){
        return 1.0;
    }
    // raised cosine, scale at loc and 1 with zero slope at the support edge
    const double bump = 0.5*(1.0 + std::cos(vtkMath::Pi()*dist/halfLen));
    return 1.0 - (1.0 - scale)*bump;
}


widthProfile::widthProfile(double startW, double endW){
    checkWidth(startW);
    checkWidth(endW);
    startWidth = startW;
    endWidth = endW;
}


void widthProfile::taperTo(double endW){
    checkWidth(endW);
    endWidth = endW;
}


void widthProfile::setStartWidth(double startW){
    checkWidth(startW);
    startWidth = startW;
}


void widthProfile::addNarrowing(double loc, double length, double scale){
    if(!inUnitInterval(loc)){
        throw outOfRange(fmt::format("narrowing location {} outside [0,1]", loc));
    }
    if(!inUnitInterval(length)){
        throw outOfRange(fmt::format("narrowing length {} outside [0,1]", length));
    }
    if(!inUnitInterval(scale)){
        throw outOfRange(fmt::format("narrowing scale {} outside [0,1]", scale));
    }
    // support beyond [0,1] is never evaluated, so clipping is implicit
    narrowings.push_back({loc, length, scale});
}


double widthProfile::getBaseWidth(double t) const {
    return startWidth + (endWidth - startWidth)*t;
}


double widthProfile::getWidth(double t) const {
    double w = getBaseWidth(t);
    for(const auto& n : narrowings){
        w *= n.factor(t);
    }
    return w;
}

