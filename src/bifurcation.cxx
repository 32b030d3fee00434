/*! \file bifurcation.cxx
 *  \brief vesselPhantom bifurcation model
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

#include "bifurcation.hxx"

#include <spdlog/spdlog.h>


bifurcationModel buildBifurcation(
    int width,
    int height,
    double length,
    double vesselWidth,
    double angle
) {
    bifurcationModel model;
    model.tree = std::make_unique<vesselTree>(width, height);

    const double mid = height/2.0;

    // inlet
    model.v0 = &model.tree->addVessel({0.0, mid}, {length, mid}, vesselWidth);
    const unsigned int lowEnd = model.v0->addEnd(angle);
    const unsigned int highEnd = model.v0->addEnd(-angle);

    // branches leave the inlet under +/- angle and arrive horizontally
    model.v1 = &model.v0->appendVessel(lowEnd, {static_cast<double>(width), 0.75*height},
        vesselWidth, 0.0);
    model.v2 = &model.v0->appendVessel(highEnd, {static_cast<double>(width), 0.25*height},
        vesselWidth, 0.0);

    spdlog::debug("Bifurcation {}x{}: inlet length {}, width {}, angle {}",
        width, height, length, vesselWidth, angle);

    return model;
}
