/*! \file probes.hxx
 *  \brief vesselPhantom probe output header file
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

#ifndef __PROBES_HXX__
#define __PROBES_HXX__

#include <filesystem>
#include <string>
#include <vector>

#include <vtkSmartPointer.h>
#include <vtkImageData.h>

#include "vessel.hxx"

// named probe location in pixel space
struct probe{
    std::string name;
    pixelPos pos;
};

// one "name,x,y" line per probe
void writeProbeFile(const std::filesystem::path& filename, const std::vector<probe>& probes);

// copy of image with a filled disk at every probe
vtkSmartPointer<vtkImageData> drawProbes(vtkImageData* image, const std::vector<probe>& probes,
    double radius);

#endif /* __PROBES_HXX__ */
