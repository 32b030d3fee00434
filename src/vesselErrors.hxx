/*! \file vesselErrors.hxx
 *  \brief vesselPhantom error header file
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

#ifndef __VESSELERRORS_HXX__
#define __VESSELERRORS_HXX__

#include <stdexcept>
#include <string>

// degenerate input: coincident points, bad width, reused end
class invalidGeometry : public std::invalid_argument {
public:
    explicit invalidGeometry(const std::string& what) : std::invalid_argument(what) {}
};

// parameter outside its normalized domain
class outOfRange : public std::out_of_range {
public:
    explicit outOfRange(const std::string& what) : std::out_of_range(what) {}
};

// canvas cannot be rendered
class renderFailure : public std::runtime_error {
public:
    explicit renderFailure(const std::string& what) : std::runtime_error(what) {}
};

#endif /* __VESSELERRORS_HXX__ */
