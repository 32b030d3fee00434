/*! \file widthProfile.hxx
 *  \brief vesselPhantom width profile header file
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

#ifndef __WIDTHPROFILE_HXX__
#define __WIDTHPROFILE_HXX__

#include <vector>


/**********************************************
*
* structure for a localized narrowing (stenosis)
*
**********************************************/
struct narrowing{
    // center of support (fraction of arc length)
    double loc;
    // length of support (fraction of arc length)
    double length;
    // width factor reached at loc
    double scale;
    // multiplicative factor at fractional arc length t
    double factor(double t) const;
};


/**********************************************
*
* Class for the width of a segment along its
* arc length: linear taper from start to end
* width times every narrowing factor
*
**********************************************/

class widthProfile {
    // start and end width (pixels)
    double startWidth, endWidth;
    // narrowings in insertion order
    std::vector<narrowing> narrowings;
public:
    widthProfile(double startW, double endW);
    // set end width, last call wins
    void taperTo(double endW);
    // set start width, used to follow the parent segment
    void setStartWidth(double startW);
    // append a narrowing, arguments checked against [0,1]
    void addNarrowing(double loc, double length, double scale);
    // full width at fractional arc length t
    double getWidth(double t) const;
    // width without narrowings at fractional arc length t
    double getBaseWidth(double t) const;
    double getStartWidth() const { return startWidth; }
    double getEndWidth() const { return endWidth; }
    const std::vector<narrowing>& getNarrowings() const { return narrowings; }
};

#endif /* __WIDTHPROFILE_HXX__ */
