/*! \file abdominal.cxx
 *  \brief vesselPhantom abdominal aorta model
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

// Diameters and distances follow Taylor, Hughes & Zarins, Ann. Biomed.
// Eng. 26 (1998), Horejs et al., J. Comput. Assist. Tomogr. 12(4) (1988)
// and average peripheral vessel diameters; distances not reported there
// were measured on a 3d scan of an aorta.

#include "abdominal.hxx"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "vesselErrors.hxx"


abdominalModel buildAbdominal(double scale){
    if(!(scale > 0.0) || !std::isfinite(scale)){
        throw invalidGeometry(fmt::format("abdominal scale must be positive, got {}", scale));
    }

    const double width = scale*15.0;
    const double height = scale*6.0;

    // diameters (cm)
    const double wSupraceliacAortaStart = 2.07;
    const double wAortaStart = 1.75;
    const double wAortaEnd = 1.6;
    const double wCeliac = 0.78;
    const double wRenal = 0.5;
    const double wSuperiorMesenteric = 0.7;
    const double wInferiorMesenteric = 0.4;
    const double wIliac = 1.04;

    // distances from the left edge (cm)
    const double posCeliac = 1.0;
    const double posRenal = 4.0;
    const double posBifur = 11.0;
    const double posSuperiorMesenteric = 3.0;
    const double posInferiorMesenteric = posSuperiorMesenteric + 5.0;

    // upper wall of the aorta, pulled 3 mm inside the lumen (pixels)
    const double posAortaTop = height/2.0 - std::min(wAortaStart, wAortaEnd)*scale/2.0 + 0.3*scale;

    abdominalModel model;
    model.tree = std::make_unique<vesselTree>(
        static_cast<int>(std::lround(width)), static_cast<int>(std::lround(height)));
    vesselTree& abdominal = *model.tree;

    vesselSeg& supraceliacAorta = abdominal.addVessel(
        {0.0, height/2.0}, {posRenal*scale, height/2.0}, wSupraceliacAortaStart*scale);
    const unsigned int supraEndL = supraceliacAorta.addEnd(30.0);
    const unsigned int supraEndC = supraceliacAorta.addEnd(0.0);
    const unsigned int supraEndR = supraceliacAorta.addEnd(-30.0);

    // aorta narrows after the celiac artery
    vesselSeg& aorta = supraceliacAorta.appendVessel(supraEndC,
        {posBifur*scale, height/2.0}, wAortaStart*scale);
    aorta.taperTo(wAortaEnd*scale);
    const unsigned int aortaEndL = aorta.addEnd(30.0);
    const unsigned int aortaEndR = aorta.addEnd(-30.0);

    vesselSeg& leftIliac = aorta.appendVessel(aortaEndL, {width, 5.0*scale}, wIliac*scale);
    vesselSeg& rightIliac = aorta.appendVessel(aortaEndR, {width, 1.0*scale}, wIliac*scale);

    vesselSeg& celiac = abdominal.addVessel(
        {posCeliac*scale, posAortaTop - 0.3*scale},
        {posCeliac*scale + 1.0*scale, 0.0},
        wCeliac*scale, -50.0, -90.0);

    vesselSeg& leftRenal = supraceliacAorta.appendVessel(supraEndL,
        {posRenal*scale + 2.5*scale, height}, wRenal*scale, 90.0);
    vesselSeg& rightRenal = supraceliacAorta.appendVessel(supraEndR,
        {posRenal*scale + 2.5*scale, 0.0}, wRenal*scale, -90.0);

    vesselSeg& superiorMesenteric = abdominal.addVessel(
        {posSuperiorMesenteric*scale, posAortaTop - 0.3*scale},
        {posSuperiorMesenteric*scale + 0.9*scale, 0.0},
        wSuperiorMesenteric*scale, -40.0, -90.0);
    vesselSeg& inferiorMesenteric = abdominal.addVessel(
        {posInferiorMesenteric*scale, posAortaTop},
        {posInferiorMesenteric*scale + 1.0*scale, 0.0},
        wInferiorMesenteric*scale, -60.0, -90.0);

    model.arteries = {
        {"supraceliac_aorta", &supraceliacAorta},
        {"aorta", &aorta},
        {"celiac", &celiac},
        {"superior_mesenteric", &superiorMesenteric},
        {"left_renal", &leftRenal},
        {"right_renal", &rightRenal},
        {"inferior_mesenteric", &inferiorMesenteric},
        {"left_iliac", &leftIliac},
        {"right_iliac", &rightIliac},
    };

    spdlog::debug("Abdominal aorta at {} px/cm: {} segments", scale, abdominal.numSeg());

    return model;
}
