/*! \file abdominal.hxx
 *  \brief vesselPhantom abdominal aorta model header file
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

#ifndef __ABDOMINAL_HXX__
#define __ABDOMINAL_HXX__

#include <map>
#include <memory>
#include <string>

#include "vessel.hxx"

/**********************************************
*
* structure for the idealized flattened
* abdominal aorta
*
**********************************************/
struct abdominalModel{
    std::unique_ptr<vesselTree> tree;
    // supraceliac_aorta, aorta, celiac, superior_mesenteric,
    // left_renal, right_renal, inferior_mesenteric,
    // left_iliac, right_iliac
    std::map<std::string, vesselSeg*> arteries;
};

// canvas is 15 x 6 cm, scale in pixels per cm
abdominalModel buildAbdominal(double scale);

#endif /* __ABDOMINAL_HXX__ */
