/*! \file centerline.hxx
 *  \brief vesselPhantom centerline header file
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

#ifndef __CENTERLINE_HXX__
#define __CENTERLINE_HXX__

#include <vector>


/**********************************************
*
* Class for a vessel centerline
*
* Cubic Hermite curve through two endpoints
* with prescribed end directions. Tangent
* magnitude at both ends is the chord length.
* Queries use fractional arc length t in [0,1].
*
**********************************************/

class centerline {
    // start and end position (pixels)
    double startPos[2];
    double endPos[2];
    // start and end direction (unit vector)
    double startDir[2];
    double endDir[2];
    // distance between endpoints
    double chord;
    // cumulative arc length at uniform curve parameter steps
    std::vector<double> arcTable;
    // position at curve parameter s
    void evalCurve(double s, double pos[2]) const;
    // derivative at curve parameter s
    void evalDeriv(double s, double deriv[2]) const;
    // curve parameter at fractional arc length t
    double curveParam(double t) const;
public:
    // angles in degrees, measured from +x toward +y
    centerline(const double start[2], double startAngle, const double end[2], double endAngle);
    // total arc length (pixels)
    double getLength() const;
    // position at fractional arc length t
    void getPoint(double t, double pos[2]) const;
    // unit tangent at fractional arc length t
    void getTangent(double t, double dir[2]) const;
};

#endif /* __CENTERLINE_HXX__ */
