/*! \file centerline.cxx
 *  \brief vesselPhantom centerline
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

#include "centerline.hxx"

#include <algorithm>
#include <cmath>

#include <vtkMath.h>

#include "vesselErrors.hxx"

// minimum number of arc length table steps
static const unsigned int minSteps = 256;
// arc length table steps per pixel of chord
static const double stepsPerPixel = 4.0;


centerline::centerline(const double start[2], double startAngle, const double end[2], double endAngle){
    for(int i=0; i<2; i++){
        startPos[i] = start[i];
        endPos[i] = end[i];
    }

    double diff[2] = {endPos[0]-startPos[0], endPos[1]-startPos[1]};
    chord = vtkMath::Norm2D(diff);
    if(!(chord > 0.0) || !std::isfinite(chord)){
        throw invalidGeometry("centerline endpoints must be distinct and finite");
    }

    const double a0 = vtkMath::RadiansFromDegrees(startAngle);
    const double a1 = vtkMath::RadiansFromDegrees(endAngle);
    startDir[0] = std::cos(a0);
    startDir[1] = std::sin(a0);
    endDir[0] = std::cos(a1);
    endDir[1] = std::sin(a1);

    // cumulative chord length of a fine polyline approximation
    const unsigned int nSteps = std::max(minSteps,
        static_cast<unsigned int>(std::ceil(stepsPerPixel*chord)));
    arcTable.resize(nSteps+1);
    arcTable[0] = 0.0;
    double prev[2] = {startPos[0], startPos[1]};
    for(unsigned int i=1; i<=nSteps; i++){
        double cur[2];
        evalCurve(static_cast<double>(i)/nSteps, cur);
        double step[2] = {cur[0]-prev[0], cur[1]-prev[1]};
        arcTable[i] = arcTable[i-1] + vtkMath::Norm2D(step);
        prev[0] = cur[0];
        prev[1] = cur[1];
    }
}


void centerline::evalCurve(double s, double pos[2]) const {
    const double s2 = s*s;
    const double s3 = s2*s;
    // Hermite basis
    const double h00 = 2.0*s3 - 3.0*s2 + 1.0;
    const double h10 = s3 - 2.0*s2 + s;
    const double h01 = -2.0*s3 + 3.0*s2;
    const double h11 = s3 - s2;

    for(int i=0; i<2; i++){
        pos[i] = h00*startPos[i] + h10*chord*startDir[i]
            + h01*endPos[i] + h11*chord*endDir[i];
    }
}


void centerline::evalDeriv(double s, double deriv[2]) const {
    const double s2 = s*s;
    const double d00 = 6.0*s2 - 6.0*s;
    const double d10 = 3.0*s2 - 4.0*s + 1.0;
    const double d01 = -6.0*s2 + 6.0*s;
    const double d11 = 3.0*s2 - 2.0*s;

    for(int i=0; i<2; i++){
        deriv[i] = d00*startPos[i] + d10*chord*startDir[i]
            + d01*endPos[i] + d11*chord*endDir[i];
    }
}


double centerline::curveParam(double t) const {
    const unsigned int nSteps = arcTable.size()-1;
    if(t <= 0.0){
        return 0.0;
    }
    if(t >= 1.0){
        return 1.0;
    }

    const double target = t*arcTable.back();
    // first table entry not below target
    auto it = std::lower_bound(arcTable.begin(), arcTable.end(), target);
    unsigned int hi = static_cast<unsigned int>(it - arcTable.begin());
    if(hi == 0){
        return 0.0;
    }
    if(hi > nSteps){
        return 1.0;
    }
    const unsigned int lo = hi-1;
    const double span = arcTable[hi] - arcTable[lo];
    const double frac = (span > 0.0) ? (target - arcTable[lo])/span : 0.0;
    return (lo + frac)/nSteps;
}


double centerline::getLength() const {
    return arcTable.back();
}


void centerline::getPoint(double t, double pos[2]) const {
    // exact endpoints, no table round off
    if(t <= 0.0){
        pos[0] = startPos[0];
        pos[1] = startPos[1];
        return;
    }
    if(t >= 1.0){
        pos[0] = endPos[0];
        pos[1] = endPos[1];
        return;
    }
    evalCurve(curveParam(t), pos);
}


void centerline::getTangent(double t, double dir[2]) const {
    if(t <= 0.0){
        dir[0] = startDir[0];
        dir[1] = startDir[1];
        return;
    }
    if(t >= 1.0){
        dir[0] = endDir[0];
        dir[1] = endDir[1];
        return;
    }
    evalDeriv(curveParam(t), dir);
    if(vtkMath::Normalize2D(dir) <= 0.0){
        // cusp, fall back to chord direction
        dir[0] = (endPos[0]-startPos[0])/chord;
        dir[1] = (endPos[1]-startPos[1])/chord;
    }
}
