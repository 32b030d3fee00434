/*! \file bifurcation.hxx
 *  \brief vesselPhantom bifurcation model header file
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

#ifndef __BIFURCATION_HXX__
#define __BIFURCATION_HXX__

#include <memory>

#include "vessel.hxx"

/**********************************************
*
* structure for a single bifurcation:
* inlet v0 splits into v1 (lower) and v2 (upper)
*
**********************************************/
struct bifurcationModel{
    std::unique_ptr<vesselTree> tree;
    vesselSeg* v0;
    vesselSeg* v1;
    vesselSeg* v2;
};

// inlet of given length along the horizontal midline, branches
// leave at +/- angle (degrees) and end at the right edge
bifurcationModel buildBifurcation(
    int width,
    int height,
    double length,
    double vesselWidth,
    double angle
);

#endif /* __BIFURCATION_HXX__ */
