/*! \file probes.cxx
 *  \brief vesselPhantom probe output
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

#include "probes.hxx"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "intensity.hxx"


void writeProbeFile(const std::filesystem::path& filename, const std::vector<probe>& probes){
    auto out = std::ofstream(filename);
    if(!out){
        int errcode = static_cast<int>(std::errc::no_such_file_or_directory);
        throw std::system_error(errcode, std::system_category(), filename.native());
    }
    out.exceptions(std::ios::badbit | std::ios::failbit);

    for(const auto& p : probes){
        out << fmt::format("{},{},{}\n", p.name, p.pos[0], p.pos[1]);
    }
    out.close();
}


vtkSmartPointer<vtkImageData> drawProbes(vtkImageData* image, const std::vector<probe>& probes,
    double radius){

    vtkSmartPointer<vtkImageData> marked =
        vtkSmartPointer<vtkImageData>::New();
    marked->DeepCopy(image);

    int dim[3];
    marked->GetDimensions(dim);
    unsigned char* pix = static_cast<unsigned char*>(marked->GetScalarPointer());

    const double r2 = radius*radius;
    const int reach = static_cast<int>(std::ceil(radius));

    for(const auto& p : probes){
        const int ci = static_cast<int>(std::lround(p.pos[0]));
        const int cj = static_cast<int>(std::lround(p.pos[1]));
        for(int dj = -reach; dj <= reach; dj++){
            int jj = cj + dj; if(jj < 0 || jj >= dim[1]) continue;
            for(int di = -reach; di <= reach; di++){
                int ii = ci + di; if(ii < 0 || ii >= dim[0]) continue;
                if(di*di + dj*dj > r2) continue;
                pix[static_cast<std::size_t>(jj)*dim[0] + ii] = intensity::probe;
            }
        }
    }

    return marked;
}
