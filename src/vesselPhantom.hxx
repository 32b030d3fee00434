/*! \file vesselPhantom.hxx
 *  \brief vesselPhantom main header file
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

#ifndef __VESSELPHANTOM_HXX__
#define __VESSELPHANTOM_HXX__

#include <filesystem>
#include <fstream>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <cstdlib>

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

// vtk stuff
#include <vtkSmartPointer.h>
#include <vtkImageData.h>
#include <vtkImageFlip.h>
#include <vtkPNGWriter.h>
#include <vtkErrorCode.h>

#include "vessel.hxx"
#include "vesselErrors.hxx"
#include "bifurcation.hxx"
#include "abdominal.hxx"
#include "probes.hxx"

#endif /* __VESSELPHANTOM_HXX__ */
