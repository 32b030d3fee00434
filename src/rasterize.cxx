/*! \file rasterize.cxx
 *  \brief vesselPhantom rasterization
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

#include "rasterize.hxx"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <vtkType.h>

#include "intensity.hxx"
#include "vessel.hxx"
#include "vesselErrors.hxx"


tubeSamples sampleTube(const vesselSeg& seg){
    const centerline& line = seg.getCenterline();
    const widthProfile& profile = seg.getProfile();

    const unsigned int nPieces = std::max(minSamplePieces,
        static_cast<unsigned int>(std::ceil(line.getLength()/maxSampleStep)));

    tubeSamples tube;
    tube.x.resize(nPieces+1);
    tube.y.resize(nPieces+1);
    tube.r.resize(nPieces+1);

    tube.bounds[0] = tube.bounds[2] = std::numeric_limits<double>::max();
    tube.bounds[1] = tube.bounds[3] = std::numeric_limits<double>::lowest();

    for(unsigned int i=0; i<=nPieces; i++){
        const double t = static_cast<double>(i)/nPieces;
        double pos[2];
        line.getPoint(t, pos);
        const double r = 0.5*profile.getWidth(t);
        tube.x[i] = pos[0];
        tube.y[i] = pos[1];
        tube.r[i] = r;
        tube.bounds[0] = std::min(tube.bounds[0], pos[0]-r);
        tube.bounds[1] = std::max(tube.bounds[1], pos[0]+r);
        tube.bounds[2] = std::min(tube.bounds[2], pos[1]-r);
        tube.bounds[3] = std::max(tube.bounds[3], pos[1]+r);
    }

    return tube;
}


// distance from (px,py) to piece k, radius linear along it
static double pieceDistance(const tubeSamples& tube, std::size_t k, double px, double py){
    const double ax = tube.x[k];
    const double ay = tube.y[k];
    const double ex = tube.x[k+1]-ax;
    const double ey = tube.y[k+1]-ay;
    const double len2 = ex*ex + ey*ey;

    double u = 0.0;
    if(len2 > 0.0){
        u = std::clamp(((px-ax)*ex + (py-ay)*ey)/len2, 0.0, 1.0);
    }
    const double dx = px - (ax + u*ex);
    const double dy = py - (ay + u*ey);
    const double r = tube.r[k] + u*(tube.r[k+1]-tube.r[k]);
    return std::sqrt(dx*dx + dy*dy) - r;
}


double tubeDistance(const tubeSamples& tube, double px, double py){
    double best = std::numeric_limits<double>::max();
    const std::size_t n = tube.x.size();

    for(std::size_t k=0; k+1<n; k++){
        best = std::min(best, pieceDistance(tube, k, px, py));
    }

    return best;
}


std::vector<std::size_t> rowPieces(const tubeSamples& tube, double py, double pad){
    std::vector<std::size_t> pieces;
    const std::size_t n = tube.x.size();

    for(std::size_t k=0; k+1<n; k++){
        const double reach = std::max(tube.r[k], tube.r[k+1]) + pad;
        const double yLo = std::min(tube.y[k], tube.y[k+1]) - reach;
        const double yHi = std::max(tube.y[k], tube.y[k+1]) + reach;
        if(py >= yLo && py <= yHi){
            pieces.push_back(k);
        }
    }

    return pieces;
}


double tubeDistance(const tubeSamples& tube, const std::vector<std::size_t>& pieces,
    double px, double py){
    double best = std::numeric_limits<double>::max();

    for(const std::size_t k : pieces){
        best = std::min(best, pieceDistance(tube, k, px, py));
    }

    return best;
}


double pixelCoverage(double d){
    // one pixel wide linear ramp centered on the boundary
    return std::clamp(0.5 - d, 0.0, 1.0);
}


vtkSmartPointer<vtkImageData> rasterizeTree(const vesselTree& tree){
    const int nx = tree.getWidth();
    const int ny = tree.getHeight();

    vtkSmartPointer<vtkImageData> image =
        vtkSmartPointer<vtkImageData>::New();
    image->SetDimensions(nx, ny, 1);
    image->SetOrigin(0.0, 0.0, 0.0);
    image->SetSpacing(1.0, 1.0, 1.0);
    image->AllocateScalars(VTK_UNSIGNED_CHAR, 1);

    unsigned char* pix = static_cast<unsigned char*>(image->GetScalarPointer());
    if(pix == nullptr){
        throw renderFailure(fmt::format("could not allocate {}x{} image", nx, ny));
    }

    // sample every segment once
    std::vector<tubeSamples> tubes;
    tubes.reserve(tree.numSeg());
    for(std::size_t s=0; s<tree.numSeg(); s++){
        tubes.push_back(sampleTube(tree.getSeg(s)));
    }

    // coverage ramp reaches half a pixel outside the tube
    const double pad = 1.0;
    const double range = static_cast<double>(intensity::lumen) - intensity::bg;

#pragma omp parallel for schedule(static)
    for(int j=0; j<ny; j++){
        std::vector<double> rowDist(nx, std::numeric_limits<double>::max());
        const double py = j;

        for(const auto& tube : tubes){
            if(py < tube.bounds[2]-pad || py > tube.bounds[3]+pad){
                continue;
            }
            // pieces farther than pad from the row leave zero coverage
            const std::vector<std::size_t> pieces = rowPieces(tube, py, pad);
            if(pieces.empty()){
                continue;
            }
            // clip to the canvas before converting to int
            const int iStart = static_cast<int>(std::clamp(std::floor(tube.bounds[0]-pad), 0.0, static_cast<double>(nx)));
            const int iEnd = static_cast<int>(std::clamp(std::ceil(tube.bounds[1]+pad), -1.0, nx-1.0));
            for(int i=iStart; i<=iEnd; i++){
                // union of tubes is the minimum distance
                rowDist[i] = std::min(rowDist[i], tubeDistance(tube, pieces, i, py));
            }
        }

        unsigned char* row = pix + static_cast<std::size_t>(j)*nx;
        for(int i=0; i<nx; i++){
            const double cov = pixelCoverage(rowDist[i]);
            row[i] = static_cast<unsigned char>(intensity::bg + std::lround(cov*range));
        }
    }

    spdlog::debug("Rasterized {} segments into {}x{} image", tubes.size(), nx, ny);

    return image;
}
