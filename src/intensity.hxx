/*! \file intensity.hxx
 *  \brief vesselPhantom intensity header file
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

#ifndef __INTENSITY_HXX__
#define __INTENSITY_HXX__

// gray values of the rendered image

namespace intensity {
    const static unsigned char bg = 0;
    const static unsigned char lumen = 255;

    // probe markers on the overlay image
    const static unsigned char probe = 128;
}

#endif /* __INTENSITY_HXX__ */
